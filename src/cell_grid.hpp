#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "sim_params.hpp"

enum class Cell : std::uint8_t { Dead = 0, Alive = 1 };

inline bool isAlive(Cell c) { return c == Cell::Alive; }
inline bool isDead(Cell c) { return c == Cell::Dead; }
inline Cell flipped(Cell c) { return isAlive(c) ? Cell::Dead : Cell::Alive; }

/*
Grid: dense size x size x size arena of cells, all Dead on construction.
size must lie in [1, MAX_ARENA_SIZE]. get/set throw std::out_of_range for a
coordinate outside [0, size).
*/
class Grid {
    public:
        explicit Grid(int size);

        int size() const { return n; }

        Cell get(int x, int y, int z) const;
        void set(int x, int y, int z, Cell cell);

        bool inBounds(int x, int y, int z) const {
            return x >= 0 && x < n && y >= 0 && y < n && z >= 0 && z < n;
        }

        int countAlive() const;
        void clear();

        bool operator==(const Grid& other) const {
            return n == other.n && cells == other.cells;
        }
        bool operator!=(const Grid& other) const { return !(*this == other); }

    private:
        std::size_t idx(int x, int y, int z) const {
            const std::size_t side = static_cast<std::size_t>(n);
            return static_cast<std::size_t>(x) + side * (static_cast<std::size_t>(y) + side * static_cast<std::size_t>(z));
        }
        void checkCoord(int x, int y, int z) const;

        int n;
        std::vector<Cell> cells;
};
