#include "cube_mesh.hpp"

void appendCubeFace(CubeMesh& mesh, float size, Axis axis, bool positive, float depth) {
    const float s = size * 0.5f;
    const float corners[4][2] = {{s, s}, {s, -s}, {-s, -s}, {-s, s}};
    const float d = positive ? depth : -depth;
    const unsigned offset = static_cast<unsigned>(mesh.vertices.size());

    for (const auto& c : corners) {
        MeshVertex v;
        switch (axis) {
            case Axis::X:
                v.position = Vec3{d, c[1], c[0]};
                v.normal = Vec3{1.0f, 0.0f, 0.0f};
                break;
            case Axis::Y:
                v.position = Vec3{c[0], d, c[1]};
                v.normal = Vec3{0.0f, 1.0f, 0.0f};
                break;
            case Axis::Z:
                v.position = Vec3{c[0], c[1], d};
                v.normal = Vec3{0.0f, 0.0f, 1.0f};
                break;
        }
        mesh.vertices.push_back(v);
    }

    const unsigned quad[6] = {0, 1, 2, 0, 3, 2};
    for (unsigned i : quad) {
        mesh.indices.push_back(i + offset);
    }
}

CubeMesh makeCubeMesh(float size) {
    CubeMesh mesh;
    const float half = size / 2.0f;
    appendCubeFace(mesh, size, Axis::X, true, half);
    appendCubeFace(mesh, size, Axis::X, false, half);
    appendCubeFace(mesh, size, Axis::Y, true, half);
    appendCubeFace(mesh, size, Axis::Y, false, half);
    appendCubeFace(mesh, size, Axis::Z, true, half);
    appendCubeFace(mesh, size, Axis::Z, false, half);
    return mesh;
}
