#include <iostream>
#include "gtest/gtest.h"
#include "path.hpp"

using namespace std;

namespace {

TEST(Path, LineToOnEmptyPathMoves) {
  Path path;
  path.LineTo(vec2(3, 4));
  ASSERT_EQ(1, path.sub_paths().size());
  EXPECT_EQ(vector<vec2>{ vec2(3, 4) }, path.sub_paths()[0].points);
}

TEST(Path, MoveToStartsSubPath) {
  Path path;
  path.MoveTo(vec2(0, 0));
  path.LineTo(vec2(1, 0));
  path.MoveTo(vec2(5, 5));
  path.LineTo(vec2(6, 5));

  ASSERT_EQ(2, path.sub_paths().size());
  EXPECT_EQ(2, path.sub_paths()[0].points.size());
  EXPECT_EQ(vec2(5, 5), path.sub_paths()[1].points[0]);
  EXPECT_FALSE(path.sub_paths()[0].closed);
}

TEST(Path, LineToAfterCloseContinuesFromFirstPoint) {
  Path path;
  path.MoveTo(vec2(1, 1));
  path.LineTo(vec2(2, 1));
  path.LineTo(vec2(2, 2));
  path.Close();
  path.LineTo(vec2(9, 9));

  ASSERT_EQ(2, path.sub_paths().size());
  EXPECT_TRUE(path.sub_paths()[0].closed);
  EXPECT_EQ(3, path.sub_paths()[0].points.size());

  const SubPath& next = path.sub_paths()[1];
  EXPECT_FALSE(next.closed);
  ASSERT_EQ(2, next.points.size());
  EXPECT_EQ(vec2(1, 1), next.points[0]);
  EXPECT_EQ(vec2(9, 9), next.points[1]);
}

TEST(Path, CloseOnEmptyPathIsIgnored) {
  Path path;
  path.Close();
  EXPECT_TRUE(path.sub_paths().empty());
}

TEST(Path, Clear) {
  Path path;
  path.MoveTo(vec2(0, 0));
  path.LineTo(vec2(1, 1));
  path.Clear();
  EXPECT_TRUE(path.sub_paths().empty());
}

} // End of namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
