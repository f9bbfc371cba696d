#include <gtest/gtest.h>

#include "Associator.hpp"
#include <stdexcept>

namespace {

// Unit-height strips along x, so IoU is the 1-D overlap ratio.
Box strip(double x1, double x2)
{
    return {x1, 0, x2, 10};
}

}  // namespace

class AssociatorTest : public ::testing::TestWithParam<std::string> {
protected:
    std::unique_ptr<Associator> assoc = make_associator(GetParam());
};

TEST_P(AssociatorTest, EmptyTracks) {
    Association a = assoc->associate({}, {strip(0, 10), strip(20, 30)}, 0.3);
    EXPECT_TRUE(a.matches.empty());
    EXPECT_TRUE(a.unmatched_tracks.empty());
    EXPECT_EQ(a.unmatched_detections, (std::vector<int>{0, 1}));
}

TEST_P(AssociatorTest, EmptyDetections) {
    Association a = assoc->associate({strip(0, 10), strip(20, 30)}, {}, 0.3);
    EXPECT_TRUE(a.matches.empty());
    EXPECT_EQ(a.unmatched_tracks, (std::vector<int>{0, 1}));
    EXPECT_TRUE(a.unmatched_detections.empty());
}

TEST_P(AssociatorTest, BothEmpty) {
    Association a = assoc->associate({}, {}, 0.3);
    EXPECT_TRUE(a.matches.empty());
    EXPECT_TRUE(a.unmatched_tracks.empty());
    EXPECT_TRUE(a.unmatched_detections.empty());
}

TEST_P(AssociatorTest, MatchesAcrossPermutedDetections) {
    std::vector<Box> tracks{strip(0, 10), strip(20, 30)};
    std::vector<Box> dets{strip(21, 31), strip(1, 11)};
    Association a = assoc->associate(tracks, dets, 0.3);

    ASSERT_EQ(a.matches.size(), 2u);
    EXPECT_EQ(a.matches[0], std::make_pair(0, 1));
    EXPECT_EQ(a.matches[1], std::make_pair(1, 0));
    EXPECT_TRUE(a.unmatched_tracks.empty());
    EXPECT_TRUE(a.unmatched_detections.empty());
}

TEST_P(AssociatorTest, BelowThresholdStaysUnmatched) {
    // IoU 2/18
    Association a = assoc->associate({strip(0, 10)}, {strip(8, 18)}, 0.3);
    EXPECT_TRUE(a.matches.empty());
    EXPECT_EQ(a.unmatched_tracks, std::vector<int>{0});
    EXPECT_EQ(a.unmatched_detections, std::vector<int>{0});
}

TEST_P(AssociatorTest, ExtraDetectionIsUnmatched) {
    Association a = assoc->associate({strip(0, 10)},
                                     {strip(100, 110), strip(0, 10), strip(200, 210)}, 0.3);
    ASSERT_EQ(a.matches.size(), 1u);
    EXPECT_EQ(a.matches[0], std::make_pair(0, 1));
    EXPECT_EQ(a.unmatched_detections, (std::vector<int>{0, 2}));
}

INSTANTIATE_TEST_SUITE_P(Policies, AssociatorTest,
                         ::testing::Values("greedy", "hungarian"));

// t0 overlaps d1 slightly better than d0, and d1 is t1's only candidate.
//          d0       d1
//   t0   0.625    0.667
//   t1   0.219    0.667
static const std::vector<Box> kTracks{strip(0, 10), strip(4, 14)};
static const std::vector<Box> kDets{strip(-2, 7.5), strip(2, 12)};

TEST(GreedyIouAssociatorTest, FirstTrackTakesItsBestDetection) {
    GreedyIouAssociator greedy;
    Association a = greedy.associate(kTracks, kDets, 0.3);

    ASSERT_EQ(a.matches.size(), 1u);
    EXPECT_EQ(a.matches[0], std::make_pair(0, 1));
    EXPECT_EQ(a.unmatched_tracks, std::vector<int>{1});
    EXPECT_EQ(a.unmatched_detections, std::vector<int>{0});
}

TEST(GreedyIouAssociatorTest, ResultDependsOnTrackOrder) {
    GreedyIouAssociator greedy;
    std::vector<Box> reversed{kTracks[1], kTracks[0]};
    Association a = greedy.associate(reversed, kDets, 0.3);

    ASSERT_EQ(a.matches.size(), 2u);
    EXPECT_EQ(a.matches[0], std::make_pair(0, 1));
    EXPECT_EQ(a.matches[1], std::make_pair(1, 0));
}

TEST(HungarianIouAssociatorTest, FindsGlobalOptimum) {
    HungarianIouAssociator hungarian;
    Association a = hungarian.associate(kTracks, kDets, 0.3);

    ASSERT_EQ(a.matches.size(), 2u);
    EXPECT_EQ(a.matches[0], std::make_pair(0, 0));
    EXPECT_EQ(a.matches[1], std::make_pair(1, 1));
    EXPECT_TRUE(a.unmatched_tracks.empty());
    EXPECT_TRUE(a.unmatched_detections.empty());
}

TEST(SolveAssignmentTest, KnownOptimum) {
    std::vector<std::vector<double>> cost{
        {4, 1, 3},
        {2, 0, 5},
        {3, 2, 2},
    };
    EXPECT_EQ(solve_assignment(cost), (std::vector<int>{1, 0, 2}));
}

TEST(SolveAssignmentTest, EmptyAndNonSquare) {
    EXPECT_TRUE(solve_assignment({}).empty());
    EXPECT_THROW(solve_assignment({{1, 2}, {3}}), std::invalid_argument);
}

TEST(IouMatrixTest, Shape) {
    auto m = iou_matrix({strip(0, 10)}, {strip(0, 10), strip(5, 15), strip(50, 60)});
    ASSERT_EQ(m.size(), 1u);
    ASSERT_EQ(m[0].size(), 3u);
    EXPECT_DOUBLE_EQ(m[0][0], 1.0);
    EXPECT_DOUBLE_EQ(m[0][1], 5.0 / 15.0);
    EXPECT_DOUBLE_EQ(m[0][2], 0.0);
}

TEST(MakeAssociatorTest, Names) {
    EXPECT_EQ(make_associator("greedy")->name(), "greedy");
    EXPECT_EQ(make_associator("hungarian")->name(), "hungarian");
    EXPECT_THROW(make_associator("auction"), std::invalid_argument);
}
