#pragma once
#include "cell_grid.hpp"

// Computes the next generation of `current` into a fresh grid. Every cell
// reads its neighbours from `current` only, so no update is visible to
// another cell within the same step.
Grid stepGeneration(const Grid& current);
