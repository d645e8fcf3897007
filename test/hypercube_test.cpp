#include <iostream>
#include <set>
#include <tuple>
#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "hypercube.hpp"

using namespace std;

using ::testing::ElementsAre;

namespace {

int CountBits(int n) {
  int count = 0;
  for (; n; n >>= 1) count += n & 1;
  return count;
}

TEST(Hypercube, NumVertices) {
  EXPECT_EQ(4, NumVertices(2));
  EXPECT_EQ(8, NumVertices(3));
  EXPECT_EQ(16, NumVertices(4));
}

TEST(Hypercube, IsValidDimension) {
  EXPECT_FALSE(IsValidDimension(1));
  EXPECT_TRUE(IsValidDimension(2));
  EXPECT_TRUE(IsValidDimension(3));
  EXPECT_TRUE(IsValidDimension(4));
  EXPECT_FALSE(IsValidDimension(5));
}

TEST(Hypercube, GetVertex) {
  vec4 v = GetVertex(3, 2);
  EXPECT_EQ(vec4(1, 1, 0, 0), v);

  v = GetVertex(5, 3);
  EXPECT_EQ(vec4(1, -1, 1, 0), v);

  v = GetVertex(0, 4);
  EXPECT_EQ(vec4(-1, -1, -1, -1), v);

  v = GetVertex(15, 4);
  EXPECT_EQ(vec4(1, 1, 1, 1), v);
}

TEST(Hypercube, VertexHasOneSignPerActiveAxis) {
  for (int d = kMinDimensions; d <= kMaxDimensions; d++) {
    set<tuple<float, float, float, float>> seen;
    for (int i = 0; i < NumVertices(d); i++) {
      vec4 v = GetVertex(i, d);
      int signs = 0;
      for (int axis = 0; axis < 4; axis++) {
        if (axis < d) {
          EXPECT_EQ(1.0f, glm::abs(v[axis]));
          signs++;
        } else {
          EXPECT_EQ(0.0f, v[axis]);
        }
      }
      EXPECT_EQ(d, signs);
      seen.insert(make_tuple(v.x, v.y, v.z, v.w));
    }
    EXPECT_EQ(NumVertices(d), int(seen.size()));
  }
}

TEST(Hypercube, EdgesInTwoDimensions) {
  vector<Edge> edges = GetEdges(2);
  EXPECT_THAT(edges, ElementsAre(Edge(0, 1), Edge(0, 2), Edge(1, 3),
    Edge(2, 3)));
}

TEST(Hypercube, EdgesDifferInOneBit) {
  for (int d = kMinDimensions; d <= kMaxDimensions; d++) {
    vector<Edge> edges = GetEdges(d);
    ASSERT_EQ(d * (1 << (d - 1)), int(edges.size()));
    EXPECT_EQ(NumEdges(d), int(edges.size()));

    set<pair<int, int>> unique_edges;
    for (const auto& e : edges) {
      EXPECT_LT(e.a, e.b);
      EXPECT_LT(e.b, NumVertices(d));
      EXPECT_EQ(1, CountBits(e.a ^ e.b));
      unique_edges.insert(make_pair(e.a, e.b));
    }
    EXPECT_EQ(edges.size(), unique_edges.size());
  }
}

TEST(Hypercube, FaceCount) {
  EXPECT_EQ(1, int(GetFaces(2).size()));
  EXPECT_EQ(6, int(GetFaces(3).size()));
  EXPECT_EQ(24, int(GetFaces(4).size()));

  for (int d = kMinDimensions; d <= kMaxDimensions; d++) {
    EXPECT_EQ(NumFaces(d), int(GetFaces(d).size()));
  }
}

TEST(Hypercube, FacesAreSimpleLoops) {
  for (int d = kMinDimensions; d <= kMaxDimensions; d++) {
    set<set<int>> unique_faces;
    for (const auto& f : GetFaces(d)) {
      for (int i = 0; i < 4; i++) {
        int a = f.v[i];
        int b = f.v[(i + 1) % 4];
        EXPECT_EQ(1, CountBits(a ^ b));
      }

      // Opposite corners differ in two bits.
      EXPECT_EQ(2, CountBits(f.v[0] ^ f.v[2]));
      EXPECT_EQ(2, CountBits(f.v[1] ^ f.v[3]));
      unique_faces.insert(set<int>(f.v, f.v + 4));
    }
    EXPECT_EQ(NumFaces(d), int(unique_faces.size()));
  }
}

TEST(Hypercube, SquareFaceWinding) {
  vector<Face> faces = GetFaces(2);
  ASSERT_EQ(1, int(faces.size()));
  EXPECT_THAT(faces[0].v, ElementsAre(0, 1, 3, 2));
}

TEST(Hypercube, RotationPlanes) {
  EXPECT_EQ(1, NumRotationPlanes(2));
  EXPECT_EQ(3, NumRotationPlanes(3));
  EXPECT_EQ(6, NumRotationPlanes(4));

  vector<RotationPlane> planes = GetRotationPlanes(4);
  ASSERT_EQ(6, int(planes.size()));

  int expected[6][2] = { {0, 1}, {0, 2}, {0, 3}, {1, 2}, {1, 3}, {2, 3} };
  for (int p = 0; p < 6; p++) {
    EXPECT_EQ(expected[p][0], planes[p].i);
    EXPECT_EQ(expected[p][1], planes[p].j);
  }

  for (int d = kMinDimensions; d <= kMaxDimensions; d++) {
    EXPECT_EQ(NumRotationPlanes(d), int(GetRotationPlanes(d).size()));
  }
}

} // End of namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
