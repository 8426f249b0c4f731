#include "cursor.hpp"

#include <algorithm>
#include <stdexcept>

Cursor::Cursor(int arenaSize) : arenaSize(arenaSize) {
    if (arenaSize < 1) {
        throw std::invalid_argument("cursor arena size must be positive");
    }
    px = py = pz = arenaSize / 2;
}

void Cursor::move(Axis axis, int delta) {
    int* c = &px;
    switch (axis) {
        case Axis::X: c = &px; break;
        case Axis::Y: c = &py; break;
        case Axis::Z: c = &pz; break;
    }
    *c = std::max(0, std::min(arenaSize - 1, *c + delta));
}

Cell Cursor::flip(Grid& grid) const {
    Cell next = flipped(grid.get(px, py, pz));
    grid.set(px, py, pz, next);
    return next;
}
