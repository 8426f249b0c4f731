#include "instances.hpp"

float gridToWorld(int index, int size, float cellSize) {
    return index * cellSize - (size / 2) * cellSize;
}

Vec3 cellToWorld(int x, int y, int z, int size, float cellSize) {
    return Vec3{gridToWorld(x, size, cellSize),
                gridToWorld(y, size, cellSize),
                gridToWorld(z, size, cellSize)};
}

const std::vector<Vec3>& InstanceEmitter::rebuild(const Grid& grid, const Cursor& cursor) {
    list.clear();
    const int n = grid.size();
    for (int z = 0; z < n; z++) {
        for (int y = 0; y < n; y++) {
            for (int x = 0; x < n; x++) {
                if (isDead(grid.get(x, y, z)) || cursor.at(x, y, z)) continue;
                list.push_back(cellToWorld(x, y, z, n, cellSize));
            }
        }
    }
    return list;
}

void InstanceEmitter::submit(InstanceRenderer& renderer) const {
    renderer.clearInstances();
    for (const Vec3& p : list) {
        renderer.addInstance(p);
    }
    renderer.draw(list.size());
}
