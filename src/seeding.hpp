#pragma once
#include "cell_grid.hpp"

// Sets each cell of the centered cube of side `extent` Alive with
// probability `density`; cells outside it are left untouched. The same
// seed always yields the same pattern.
void randomize(Grid& grid, float density, unsigned seed, int extent);
