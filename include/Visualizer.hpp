#pragma once
#include "ClipIO.hpp"
#include "Tracker.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

const int MIN_CANVAS_SIDE = 64;
const int MAX_CANVAS_SIDE = 8192;

/**
 * Canvas large enough for every detection of the clip, each side clamped
 * to [MIN_CANVAS_SIDE, MAX_CANVAS_SIDE].
 */
cv::Size clip_extent(const Clip& clip);

cv::Scalar track_color(int track_id);

cv::Mat render_frame(const std::vector<Label>& labels, cv::Size canvas);

/** Writes <dir>/frame_<NNNN>.png. Throws std::runtime_error if the write fails. */
void draw_vis(const std::string& dir, int idx, const std::vector<Label>& labels,
              cv::Size canvas);
