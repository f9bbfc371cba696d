#include "BoxGeometry.hpp"
#include <opencv2/dnn.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace std;

double Box::area() const
{
    return max(0.0, width()) * max(0.0, height());
}

double iou(const Box& a, const Box& b)
{
    double x1 = max(a.x1, b.x1), y1 = max(a.y1, b.y1);
    double x2 = min(a.x2, b.x2), y2 = min(a.y2, b.y2);
    double inter = max(0.0, x2 - x1) * max(0.0, y2 - y1);
    double uni = a.area() + b.area() - inter;
    return uni > 0 ? inter / uni : 0.0;
}

double aspect_ratio(const Box& b)
{
    double h = b.height();
    return h > 0 ? b.width() / h : 0.0;
}

bool is_degenerate(const Box& b)
{
    if (!isfinite(b.x1) || !isfinite(b.y1) || !isfinite(b.x2) || !isfinite(b.y2))
        return true;
    double w = b.width(), h = b.height();
    // finite corners can still overflow the extent or the aspect ratio
    if (!isfinite(w) || !isfinite(h) || w <= 0.0 || h <= 0.0)
        return true;
    return !isfinite(w / h);
}

// -------- non-maximum suppression --------------

vector<size_t> nms_keep_indices(const vector<Box>& boxes,
                                const vector<double>& scores,
                                double iou_threshold)
{
    if (boxes.size() != scores.size())
        throw invalid_argument("greedy_nms: " + to_string(boxes.size()) + " boxes but "
                               + to_string(scores.size()) + " scores");
    if (boxes.empty()) return {};

    vector<cv::Rect2d> rects;
    vector<float> confs;
    rects.reserve(boxes.size());
    confs.reserve(boxes.size());
    for (size_t i = 0; i < boxes.size(); ++i) {
        const Box& b = boxes[i];
        rects.emplace_back(b.x1, b.y1, b.width(), b.height());
        confs.push_back(static_cast<float>(scores[i]));
    }

    // NMSBoxes keeps only scores strictly above the cut; score filtering is
    // the caller's job, so every box has to pass it here.
    vector<int> indices;
    cv::dnn::NMSBoxes(rects, confs, numeric_limits<float>::lowest(),
                      static_cast<float>(iou_threshold), indices);

    return vector<size_t>(indices.begin(), indices.end());
}

NmsResult greedy_nms(const vector<Box>& boxes,
                     const vector<double>& scores,
                     double iou_threshold)
{
    NmsResult out;
    for (size_t i : nms_keep_indices(boxes, scores, iou_threshold)) {
        out.boxes.push_back(boxes[i]);
        out.scores.push_back(scores[i]);
    }
    return out;
}

vector<Detection> greedy_nms(const vector<Detection>& dets, double iou_threshold)
{
    vector<Box> boxes;
    vector<double> scores;
    boxes.reserve(dets.size());
    scores.reserve(dets.size());
    for (const auto& d : dets) {
        boxes.push_back(d.box);
        scores.push_back(d.score);
    }

    vector<Detection> kept;
    for (size_t i : nms_keep_indices(boxes, scores, iou_threshold))
        kept.push_back(dets[i]);
    return kept;
}
