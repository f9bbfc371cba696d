#pragma once
#include <optional>
#include <vector>

struct Box
{
    double x1 = 0, y1 = 0, x2 = 0, y2 = 0;   // absolute pixels, top-left / bottom-right

    double width()  const { return x2 - x1; }
    double height() const { return y2 - y1; }
    double area()   const;
};

struct Detection
{
    Box                box;
    double             score = 0.0;
    std::optional<int> class_id;
};

struct NmsResult
{
    std::vector<Box>    boxes;
    std::vector<double> scores;
};

/** Intersection over union. 0 for disjoint or degenerate boxes. */
double iou(const Box& a, const Box& b);

/** width / height, or 0 when the height is not positive. */
double aspect_ratio(const Box& b);

/** True for boxes that cannot seed a track: non-finite corners, w <= 0 or h <= 0,
 *  or an extent or aspect ratio that overflows. */
bool is_degenerate(const Box& b);

// Greedy NMS: highest score first, drop everything overlapping a kept box
// by more than iou_threshold. Equal scores keep their input order.
// Throws std::invalid_argument when boxes and scores differ in length.
NmsResult greedy_nms(const std::vector<Box>& boxes,
                     const std::vector<double>& scores,
                     double iou_threshold);

std::vector<size_t> nms_keep_indices(const std::vector<Box>& boxes,
                                     const std::vector<double>& scores,
                                     double iou_threshold);

std::vector<Detection> greedy_nms(const std::vector<Detection>& dets,
                                  double iou_threshold);
