#include "Visualizer.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

cv::Size clip_extent(const Clip& clip)
{
    double w = MIN_CANVAS_SIDE, h = MIN_CANVAS_SIDE;
    for (const auto& f : clip.frames) {
        for (const auto& d : f.dets) {
            if (isfinite(d.box.x2)) w = max(w, d.box.x2);
            if (isfinite(d.box.y2)) h = max(h, d.box.y2);
        }
    }
    w = min(w, double(MAX_CANVAS_SIDE));
    h = min(h, double(MAX_CANVAS_SIDE));
    return cv::Size(int(ceil(w)), int(ceil(h)));
}

// pixel coordinate, kept well inside int range; cv::rectangle clips the rest
static int to_px(double v)
{
    const double lim = 2.0 * MAX_CANVAS_SIDE;
    return int(lround(min(max(v, -lim), lim)));
}

cv::Scalar track_color(int track_id)
{
    int r = (track_id * 77) % 256;
    int g = (track_id * 151) % 256;
    int b = (track_id * 211) % 256;
    return cv::Scalar(b, g, r);
}

cv::Mat render_frame(const vector<Label>& labels, cv::Size canvas)
{
    cv::Mat img(canvas, CV_8UC3, cv::Scalar(30, 30, 30));
    for (const auto& l : labels) {
        cv::Point tl(to_px(l.bbox.x1), to_px(l.bbox.y1));
        cv::Point br(to_px(l.bbox.x2), to_px(l.bbox.y2));
        cv::Scalar color = track_color(l.track_id);
        cv::rectangle(img, tl, br, color, 2);
        cv::putText(img, "ID: " + to_string(l.track_id), {tl.x, tl.y - 5},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
    }
    return img;
}

void draw_vis(const string& dir, int idx, const vector<Label>& labels, cv::Size canvas)
{
    ostringstream fn; fn << dir << "/frame_" << setw(4)
                         << setfill('0') << idx << ".png";
    if (!cv::imwrite(fn.str(), render_frame(labels, canvas)))
        throw runtime_error("failed to write " + fn.str());
}
