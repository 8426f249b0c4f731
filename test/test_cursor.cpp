#include <cassert>
#include <iostream>
#include "cell_grid.hpp"
#include "cursor.hpp"

void test_starts_at_center() {
    Cursor cursor(8);
    assert(cursor.at(4, 4, 4));
    std::cout << "PASSED: test_starts_at_center\n";
}

void test_moves_each_axis() {
    Cursor cursor(8);
    cursor.move(Axis::X, 1);
    cursor.move(Axis::Y, -1);
    cursor.move(Axis::Z, 1);
    cursor.move(Axis::Z, 1);
    assert(cursor.x() == 5 && cursor.y() == 3 && cursor.z() == 6);
    std::cout << "PASSED: test_moves_each_axis\n";
}

void test_clamps_at_edges() {
    Cursor cursor(4);
    for (int i = 0; i < 10; i++) cursor.move(Axis::X, -1);
    assert(cursor.x() == 0);
    for (int i = 0; i < 10; i++) cursor.move(Axis::Y, 1);
    assert(cursor.y() == 3);
    cursor.move(Axis::Y, -1);
    assert(cursor.y() == 2);

    // the cursor can always address the grid
    Grid grid(4);
    cursor.flip(grid);
    assert(grid.get(0, 2, cursor.z()) == Cell::Alive);
    std::cout << "PASSED: test_clamps_at_edges\n";
}

void test_flip_is_self_inverse() {
    Grid grid(6);
    Cursor cursor(6);
    grid.set(2, 2, 2, Cell::Alive);

    assert(cursor.flip(grid) == Cell::Alive);
    assert(grid.get(3, 3, 3) == Cell::Alive);
    assert(cursor.flip(grid) == Cell::Dead);
    assert(grid.get(3, 3, 3) == Cell::Dead);

    cursor.move(Axis::X, -1);
    cursor.move(Axis::Y, -1);
    cursor.move(Axis::Z, -1);
    cursor.flip(grid);
    cursor.flip(grid);
    assert(grid.get(2, 2, 2) == Cell::Alive);
    assert(grid.countAlive() == 1);
    std::cout << "PASSED: test_flip_is_self_inverse\n";
}

int main() {
    test_starts_at_center();
    test_moves_each_axis();
    test_clamps_at_edges();
    test_flip_is_self_inverse();

    std::cout << "\nAll cursor tests passed!\n";
    return 0;
}
