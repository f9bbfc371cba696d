#include <gtest/gtest.h>

#include "Visualizer.hpp"

TEST(VisualizerTest, ClipExtentCoversDetections) {
    Clip clip;
    clip.frames.push_back({0, {{{10, 10, 300.2, 120}, 0.9, std::nullopt}}});
    clip.frames.push_back({1, {{{10, 10, 40, 480}, 0.9, std::nullopt}}});
    cv::Size s = clip_extent(clip);
    EXPECT_EQ(s.width, 301);
    EXPECT_EQ(s.height, 480);

    EXPECT_EQ(clip_extent(Clip()), cv::Size(64, 64));
}

TEST(VisualizerTest, ClipExtentIsClamped) {
    Clip clip;
    clip.frames.push_back({0, {{{0, 0, 1e300, 120}, 0.9, std::nullopt}}});
    clip.frames.push_back({1, {{{0, 0, 50, 3e9}, 0.9, std::nullopt}}});
    EXPECT_EQ(clip_extent(clip), cv::Size(MAX_CANVAS_SIDE, MAX_CANVAS_SIDE));
}

TEST(VisualizerTest, HugeBoxStillRenders) {
    cv::Mat img;
    ASSERT_NO_THROW(img = render_frame({{3, {-1e12, 10, 1e12, 1e300}}}, cv::Size(100, 80)));
    cv::Scalar c = track_color(3);
    cv::Vec3b edge = img.at<cv::Vec3b>(10, 50);
    EXPECT_EQ(edge[0], c[0]);
    EXPECT_EQ(edge[1], c[1]);
    EXPECT_EQ(edge[2], c[2]);
}

TEST(VisualizerTest, RendersOneRectanglePerLabel) {
    cv::Mat img = render_frame({{1, {10, 20, 40, 60}}}, cv::Size(100, 80));
    ASSERT_EQ(img.cols, 100);
    ASSERT_EQ(img.rows, 80);

    cv::Scalar c = track_color(1);
    cv::Vec3b edge = img.at<cv::Vec3b>(20, 10);
    EXPECT_EQ(edge[0], c[0]);
    EXPECT_EQ(edge[1], c[1]);
    EXPECT_EQ(edge[2], c[2]);

    cv::Vec3b background = img.at<cv::Vec3b>(70, 90);
    EXPECT_EQ(background, cv::Vec3b(30, 30, 30));
}

TEST(VisualizerTest, ColorsAreStablePerId) {
    EXPECT_EQ(track_color(7), track_color(7));
    EXPECT_NE(track_color(1), track_color(2));
}
