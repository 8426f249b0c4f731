#pragma once
#include "cell_grid.hpp"

/*
Folds c + offset back into [0, size). One step past an edge wraps to the
opposite face: -1 lands on size - 1 and size lands on 0. Only offsets in
{-1, 0, 1} are defined; anything else throws std::invalid_argument.
*/
int reflectCoordinate(int c, int offset, int size);

// Live cells among the 26 neighbours of (x, y, z). Result lies in [0, 26].
int livingNeighbours(const Grid& grid, int x, int y, int z);
