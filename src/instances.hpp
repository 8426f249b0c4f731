#pragma once
#include <cstddef>
#include <vector>

#include "cell_grid.hpp"
#include "cursor.hpp"
#include "vec3.hpp"

// Consumer of per-frame instance positions (the GPU side lives outside the core).
class InstanceRenderer {
    public:
        virtual ~InstanceRenderer() {}
        virtual void clearInstances() = 0;
        virtual void addInstance(const Vec3& position) = 0;
        virtual void draw(std::size_t instanceCount) = 0;
};

// index * cellSize - (size / 2) * cellSize, with integer size / 2.
float gridToWorld(int index, int size, float cellSize);
Vec3 cellToWorld(int x, int y, int z, int size, float cellSize);

/*
InstanceEmitter: rebuilds the list of world positions of every live cell
from scratch each frame. The cursor's own cell is always left out; it is
drawn separately as a highlight.
*/
class InstanceEmitter {
    public:
        explicit InstanceEmitter(float cellSize) : cellSize(cellSize) {}

        const std::vector<Vec3>& rebuild(const Grid& grid, const Cursor& cursor);

        // Hands the current list to the renderer: clear, add each, draw.
        void submit(InstanceRenderer& renderer) const;

        const std::vector<Vec3>& instances() const { return list; }

    private:
        float cellSize;
        std::vector<Vec3> list;
};
