#include "generation.hpp"

#include "life_rule.hpp"
#include "neighbours.hpp"

Grid stepGeneration(const Grid& current) {
    const int n = current.size();
    Grid next(n);
    for (int z = 0; z < n; z++) {
        for (int y = 0; y < n; y++) {
            for (int x = 0; x < n; x++) {
                int live = livingNeighbours(current, x, y, z);
                Cell state = nextState(current.get(x, y, z), live);
                if (isAlive(state)) next.set(x, y, z, state);
            }
        }
    }
    return next;
}
