#pragma once
#include "cell_grid.hpp"
#include "vec3.hpp"

/*
Cursor: one addressable cell of the arena, used for manual edits and the
highlight draw. Starts at the arena center. Moves are clamped per axis
to [0, arenaSize - 1], so the cursor can always index the grid.
*/
class Cursor {
    public:
        explicit Cursor(int arenaSize);

        void move(Axis axis, int delta);

        // Writes the opposite state into the cursor's cell, bypassing the
        // rule. Returns the new state.
        Cell flip(Grid& grid) const;

        bool at(int cx, int cy, int cz) const { return cx == px && cy == py && cz == pz; }

        int x() const { return px; }
        int y() const { return py; }
        int z() const { return pz; }

    private:
        int px = 0, py = 0, pz = 0;
        int arenaSize;
};
