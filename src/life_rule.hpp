#pragma once
#include "cell_grid.hpp"

// Survival on 3 or 5 live neighbours, birth on exactly 5. Everything else,
// including a live cell with 4 neighbours, ends up Dead.
Cell nextState(Cell current, int liveNeighbours);
