#include "hypercube.hpp"
#include "util.hpp"

bool IsValidDimension(int dimension) {
  return dimension >= kMinDimensions && dimension <= kMaxDimensions;
}

int NumVertices(int dimension) {
  return 1 << dimension;
}

int NumEdges(int dimension) {
  return dimension * (1 << (dimension - 1));
}

int NumFaces(int dimension) {
  if (dimension < 2) return 0;
  return Combination(dimension, 2) * (1 << (dimension - 2));
}

int NumRotationPlanes(int dimension) {
  return dimension * (dimension - 1) / 2;
}

vec4 GetVertex(int index, int dimension) {
  vec4 v(0.0f);
  for (int axis = 0; axis < kMaxDimensions; axis++) {
    if (axis >= dimension) break;
    const int bit = (index >> axis) & 1;
    v[axis] = (bit == 0) ? -1.0f : 1.0f;
  }
  return v;
}

vector<Edge> GetEdges(int dimension) {
  vector<Edge> edges;
  edges.reserve(NumEdges(dimension));
  for (int i = 0; i < NumVertices(dimension); i++) {
    for (int axis = 0; axis < dimension; axis++) {
      const int j = i ^ (1 << axis);
      if (i < j) {
        edges.push_back(Edge(i, j));
      }
    }
  }
  return edges;
}

vector<Face> GetFaces(int dimension) {
  vector<Face> faces;
  faces.reserve(NumFaces(dimension));
  for (int i = 0; i < NumVertices(dimension); i++) {
    for (int a = 0; a < dimension; a++) {
      const int j = i ^ (1 << a);
      for (int b = a + 1; b < dimension; b++) {
        const int k = i ^ (1 << b);
        const int l = i ^ (1 << a) ^ (1 << b);

        // Only the lowest corner emits the face, walking i -> j -> l -> k.
        if (i < j && j < k && k < l) {
          faces.push_back(Face(i, j, l, k));
        }
      }
    }
  }
  return faces;
}

vector<RotationPlane> GetRotationPlanes(int dimension) {
  vector<RotationPlane> planes;
  for (int i = 0; i < dimension - 1; i++) {
    for (int j = i + 1; j < dimension; j++) {
      planes.push_back(RotationPlane(i, j));
    }
  }
  return planes;
}
