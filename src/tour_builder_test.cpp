#include "tour_builder.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <set>

using namespace tourplan;

namespace {

CostMatrix random_matrix(int n, std::mt19937& rng, bool symmetric) {
  std::uniform_real_distribution<double> U(1.0, 100.0);
  CostMatrix M(n);
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j) {
      if (i == j) continue;
      if (symmetric && j < i) M.at(i, j) = M.at(j, i);
      else M.at(i, j) = U(rng);
    }
  return M;
}

bool is_permutation_from(const Tour& t, int n, int start) {
  if (static_cast<int>(t.size()) != n) return false;
  if (n > 0 && t.front() != start) return false;
  std::vector<int> sorted = t;
  std::sort(sorted.begin(), sorted.end());
  for (int i = 0; i < n; ++i)
    if (sorted[i] != i) return false;
  return true;
}

} // namespace

TEST(NearestNeighbor, FollowsCheapestUnvisitedEdge) {
  const CostMatrix M = CostMatrix::from_rows({
      {0, 2, 9, 10},
      {1, 0, 6, 4},
      {15, 7, 0, 8},
      {6, 3, 12, 0},
  });
  Tour t;
  ASSERT_TRUE(nearest_neighbor(M, 0, t).ok());
  EXPECT_EQ(t, (Tour{0, 1, 3, 2}));
}

TEST(NearestNeighbor, TiesGoToLowestIndex) {
  CostMatrix M(4, 5.0);
  for (int i = 0; i < 4; ++i) M.at(i, i) = 0.0;
  Tour t;
  ASSERT_TRUE(nearest_neighbor(M, 2, t).ok());
  EXPECT_EQ(t, (Tour{2, 0, 1, 3}));
}

TEST(NearestNeighbor, IsPermutationStartingAtStart) {
  std::mt19937 rng(7);
  for (int n = 1; n <= 12; ++n) {
    const CostMatrix M = random_matrix(n, rng, false);
    for (int start = 0; start < n; ++start) {
      Tour t;
      ASSERT_TRUE(nearest_neighbor(M, start, t).ok());
      EXPECT_TRUE(is_permutation_from(t, n, start)) << "n=" << n << " start=" << start;
    }
  }
}

TEST(NearestNeighbor, EmptyMatrixGivesEmptyTour) {
  Tour t{42};
  const Status st = nearest_neighbor(CostMatrix(), 0, t);
  EXPECT_TRUE(st.ok());
  EXPECT_EQ(st.code, PlanError::EmptyInput);
  EXPECT_TRUE(t.empty());
}

TEST(NearestNeighbor, AvoidsUnreachableWhileFiniteRemains) {
  const CostMatrix M = CostMatrix::from_rows({
      {0, kUnreachable, 5},
      {1, 0, 1},
      {1, 3, 0},
  });
  Tour t;
  ASSERT_TRUE(nearest_neighbor(M, 0, t).ok());
  EXPECT_EQ(t, (Tour{0, 2, 1}));
}

TEST(NearestNeighbor, FailsWhenOnlyUnreachableRemains) {
  const CostMatrix M = CostMatrix::from_rows({
      {0, 1, kUnreachable},
      {1, 0, kUnreachable},
      {1, 1, 0},
  });
  Tour t;
  const Status st = nearest_neighbor(M, 0, t);
  EXPECT_FALSE(st.ok());
  EXPECT_EQ(st.code, PlanError::NoFeasibleTour);
}

TEST(NearestNeighbor, RejectsStartOutsideMatrix) {
  Tour t;
  EXPECT_THROW(nearest_neighbor(CostMatrix(3), 3, t), std::invalid_argument);
  EXPECT_THROW(nearest_neighbor(CostMatrix(3), -1, t), std::invalid_argument);
}

TEST(TourLength, IsOpenPath) {
  const CostMatrix M = CostMatrix::from_rows({{0, 1, 2}, {1, 0, 4}, {2, 4, 0}});
  EXPECT_DOUBLE_EQ(tour_length({0, 1, 2}, M), 5.0);
  EXPECT_DOUBLE_EQ(tour_length({0}, M), 0.0);
  EXPECT_DOUBLE_EQ(tour_length({}, M), 0.0);
}

TEST(TwoOpt, ReversesSegmentBetweenEdges) {
  CostMatrix M(5, 5.0);
  for (int i = 0; i < 5; ++i) M.at(i, i) = 0.0;
  auto sym = [&](int a, int b, double c) { M.at(a, b) = c; M.at(b, a) = c; };
  sym(0, 1, 10); sym(1, 2, 1); sym(2, 3, 10); sym(0, 2, 1); sym(1, 3, 1);

  const Tour initial{0, 1, 2, 3, 4};
  const Tour out = two_opt(initial, M);
  EXPECT_EQ(out, (Tour{0, 2, 1, 3, 4}));
  EXPECT_DOUBLE_EQ(tour_length(out, M), 8.0);
  EXPECT_EQ(initial, (Tour{0, 1, 2, 3, 4}));
}

TEST(TwoOpt, ShortToursAreUnchanged) {
  std::mt19937 rng(3);
  for (int n = 0; n <= 4; ++n) {
    const CostMatrix M = random_matrix(n, rng, true);
    Tour t(n);
    std::iota(t.begin(), t.end(), 0);
    std::reverse(t.begin() + (n > 0 ? 1 : 0), t.end());
    EXPECT_EQ(two_opt(t, M), t) << "n=" << n;
  }
}

TEST(TwoOpt, NeverLengthensAndIsIdempotent) {
  std::mt19937 rng(11);
  for (int trial = 0; trial < 40; ++trial) {
    const int n = 2 + trial % 10;
    const CostMatrix M = random_matrix(n, rng, trial % 2 == 0);
    Tour t(n);
    std::iota(t.begin(), t.end(), 0);
    std::shuffle(t.begin() + 1, t.end(), rng);

    const Tour once = two_opt(t, M);
    EXPECT_LE(tour_length(once, M), tour_length(t, M));
    EXPECT_TRUE(is_permutation_from(once, n, t.front()));
    EXPECT_EQ(once.front(), t.front());
    EXPECT_EQ(two_opt(once, M), once);
  }
}

TEST(TwoOpt, SymmetricFourStopExampleStaysWithinReversalClosure) {
  const CostMatrix M = CostMatrix::from_rows({
      {0, 10, 15, 20},
      {10, 0, 35, 25},
      {15, 35, 0, 30},
      {20, 25, 30, 0},
  });
  const Tour initial{0, 1, 3, 2};

  // every tour reachable from `initial` by repeated segment reversals behind the start
  std::set<Tour> closure{initial};
  std::vector<Tour> frontier{initial};
  while (!frontier.empty()) {
    Tour cur = frontier.back();
    frontier.pop_back();
    for (size_t a = 1; a < cur.size(); ++a)
      for (size_t b = a + 2; b <= cur.size(); ++b) {
        Tour nxt = cur;
        std::reverse(nxt.begin() + a, nxt.begin() + b);
        if (closure.insert(nxt).second) frontier.push_back(nxt);
      }
  }

  const Tour out = two_opt(initial, M);
  EXPECT_LE(tour_length(out, M), tour_length(initial, M));
  EXPECT_EQ(closure.count(out), 1u);
}

TEST(BuildTour, ConstructsThenImproves) {
  std::mt19937 rng(5);
  const CostMatrix M = random_matrix(9, rng, true);
  const TourResult r = build_tour(M, 0);
  ASSERT_TRUE(r.status.ok());

  Tour nn;
  ASSERT_TRUE(nearest_neighbor(M, 0, nn).ok());
  EXPECT_EQ(r.tour, two_opt(nn, M));
  EXPECT_DOUBLE_EQ(r.length, tour_length(r.tour, M));
  EXPECT_LE(r.length, tour_length(nn, M));
}

TEST(BuildTour, ReportsUnreachableMatrix) {
  CostMatrix M(3, kUnreachable);
  for (int i = 0; i < 3; ++i) M.at(i, i) = 0.0;
  const TourResult r = build_tour(M, 0);
  EXPECT_EQ(r.status.code, PlanError::NoFeasibleTour);
  EXPECT_TRUE(r.tour.empty());
}
