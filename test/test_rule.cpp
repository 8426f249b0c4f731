#include <cassert>
#include <iostream>
#include "cell_grid.hpp"
#include "life_rule.hpp"

void test_alive_survival() {
    assert(nextState(Cell::Alive, 0) == Cell::Dead);
    assert(nextState(Cell::Alive, 2) == Cell::Dead);
    assert(nextState(Cell::Alive, 3) == Cell::Alive);
    assert(nextState(Cell::Alive, 4) == Cell::Dead);
    assert(nextState(Cell::Alive, 5) == Cell::Alive);
    assert(nextState(Cell::Alive, 6) == Cell::Dead);
    assert(nextState(Cell::Alive, 26) == Cell::Dead);
    std::cout << "PASSED: test_alive_survival\n";
}

void test_dead_birth() {
    for (int live = 0; live <= 26; live++) {
        Cell expected = live == 5 ? Cell::Alive : Cell::Dead;
        assert(nextState(Cell::Dead, live) == expected);
    }
    std::cout << "PASSED: test_dead_birth\n";
}

int main() {
    test_alive_survival();
    test_dead_birth();

    std::cout << "\nAll rule tests passed!\n";
    return 0;
}
