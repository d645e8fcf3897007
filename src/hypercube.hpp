#ifndef __HYPERCUBE_HPP__
#define __HYPERCUBE_HPP__

#include <vector>
#include <glm/glm.hpp>

using namespace std;
using namespace glm;

const int kMinDimensions = 2;
const int kMaxDimensions = 4;
const int kDefaultDimensions = 4;

// Vertex indices are bit vectors: bit a holds the sign of axis a
// (0 -> -1, 1 -> +1). Two vertices share an edge when their indices differ
// in exactly one bit.
//
// Index     Binary    Vertex
//  0         000       [-1,-1,-1]
//  1         001       [ 1,-1,-1]
//  2         010       [-1, 1,-1]
//  3         011       [ 1, 1,-1]
//  ...
//  7         111       [ 1, 1, 1]

struct Edge {
  int a;
  int b;

  Edge() : a(0), b(0) {}
  Edge(int a, int b) : a(a), b(b) {}

  bool operator==(const Edge& other) const {
    return a == other.a && b == other.b;
  }
};

// Closed loop over four vertices. Consecutive vertices differ in one bit.
struct Face {
  int v[4];

  Face() : v{0, 0, 0, 0} {}
  Face(int i, int j, int k, int l) : v{i, j, k, l} {}
};

struct RotationPlane {
  int i;
  int j;

  RotationPlane(int i, int j) : i(i), j(j) {}
};

bool IsValidDimension(int dimension);

int NumVertices(int dimension);
int NumEdges(int dimension);
int NumFaces(int dimension);
int NumRotationPlanes(int dimension);

vec4 GetVertex(int index, int dimension);

vector<Edge> GetEdges(int dimension);
vector<Face> GetFaces(int dimension);

// Axis pairs (i, j) with i < j < dimension in row-major order:
// xy, xz, xw, yz, yw, zw for four dimensions. The rotation speeds of a
// session are indexed in this order.
vector<RotationPlane> GetRotationPlanes(int dimension);

#endif // __HYPERCUBE_HPP__
