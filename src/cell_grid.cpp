#include "cell_grid.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

Grid::Grid(int size) : n(size) {
    if (size < 1 || size > MAX_ARENA_SIZE) {
        throw std::invalid_argument("grid size must lie in [1, " + std::to_string(MAX_ARENA_SIZE) +
                                    "], got " + std::to_string(size));
    }
    cells.assign(static_cast<std::size_t>(n) * n * n, Cell::Dead);
}

void Grid::checkCoord(int x, int y, int z) const {
    if (!inBounds(x, y, z)) {
        throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) + ", " +
                                std::to_string(z) + ") outside arena of size " + std::to_string(n));
    }
}

Cell Grid::get(int x, int y, int z) const {
    checkCoord(x, y, z);
    return cells[idx(x, y, z)];
}

void Grid::set(int x, int y, int z, Cell cell) {
    checkCoord(x, y, z);
    cells[idx(x, y, z)] = cell;
}

int Grid::countAlive() const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), Cell::Alive));
}

void Grid::clear() {
    std::fill(cells.begin(), cells.end(), Cell::Dead);
}
