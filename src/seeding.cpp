#include "seeding.hpp"

#include <algorithm>
#include <random>

void randomize(Grid& grid, float density, unsigned seed, int extent) {
    const int n = grid.size();
    extent = std::max(0, std::min(extent, n));
    const int lo = (n - extent) / 2;
    const int hi = lo + extent;

    std::mt19937 rng(seed);
    std::bernoulli_distribution alive(density);
    for (int z = lo; z < hi; z++) {
        for (int y = lo; y < hi; y++) {
            for (int x = lo; x < hi; x++) {
                grid.set(x, y, z, alive(rng) ? Cell::Alive : Cell::Dead);
            }
        }
    }
}
