#pragma once
#include <vector>

#include "vec3.hpp"

struct MeshVertex {
    Vec3 position;
    Vec3 normal;
};

struct CubeMesh {
    std::vector<MeshVertex> vertices;
    std::vector<unsigned> indices;   // triangle list
};

/*
Appends one square face of side `size`, centered on the given axis at
+depth (positive) or -depth. Adds 4 vertices and two triangles. The normal
is the positive unit vector of the axis for both faces of that axis.
*/
void appendCubeFace(CubeMesh& mesh, float size, Axis axis, bool positive, float depth);

// Axis-aligned cube of side `size` centered on the origin: 24 vertices, 36 indices.
CubeMesh makeCubeMesh(float size);
