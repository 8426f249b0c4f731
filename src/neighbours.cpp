#include "neighbours.hpp"

#include <stdexcept>
#include <string>

int reflectCoordinate(int c, int offset, int size) {
    if (offset < -1 || offset > 1) {
        throw std::invalid_argument("neighbour offset must be -1, 0 or 1, got " +
                                    std::to_string(offset));
    }
    int v = c + offset;
    if (v < 0) return size + v;
    if (v > size - 1) return v - size;
    return v;
}

int livingNeighbours(const Grid& grid, int x, int y, int z) {
    const int n = grid.size();
    int count = 0;
    for (int dz = -1; dz <= 1; dz++) {
        int nz = reflectCoordinate(z, dz, n);
        for (int dy = -1; dy <= 1; dy++) {
            int ny = reflectCoordinate(y, dy, n);
            for (int dx = -1; dx <= 1; dx++) {
                if (dx == 0 && dy == 0 && dz == 0) continue;
                int nx = reflectCoordinate(x, dx, n);
                if (isAlive(grid.get(nx, ny, nz))) count++;
            }
        }
    }
    return count;
}
