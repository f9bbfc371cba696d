#pragma once
#include "BoxGeometry.hpp"
#include "Tracker.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct Frame
{
    int                    index = 0;
    std::vector<Detection> dets;
};

struct Clip
{
    std::vector<Frame> frames;
    int                skipped  = 0;   // degenerate boxes dropped while loading
    int                filtered = 0;   // detections of another class
    int                filled   = 0;   // empty frames inserted for missing indices
};

struct TrackRecord
{
    std::string video_id;
    std::string frame;      // "<video_id>_frame_<NNNN>.jpg"
    int         track_id;
    Box         bbox;
};

/**
 * Accepts [x1,y1,x2,y2,score(,class_id)] or
 * {"bbox"|"xyxy": [...], "score"|"confidence": s, "class_id": c}.
 * A missing score counts as 1.0. Throws std::runtime_error on other shapes.
 */
Detection parse_detection(const nlohmann::json& j);

/**
 * Clip JSON: array of frames, each {"frame": n, "detections": [...]} or a
 * bare detections array. A frame without "frame" takes its array position.
 * Frames come back sorted by index, with empty frames filling any missing
 * index; a repeated or negative index throws std::runtime_error.
 * person_class < 0 keeps every class; detections without a class id are
 * always kept.
 */
Clip parse_clip(const nlohmann::json& j, int person_class = -1);
Clip load_clip(const std::string& path, int person_class = -1);

std::string frame_name(const std::string& video_id, int saved_idx);

using SavedFrameFn = std::function<void(int saved_idx, const std::vector<Label>&)>;

/**
 * Run every frame of the clip through the tracker. Records are kept for
 * every output_every-th frame only; saved frames are numbered 0, 1, ...
 */
std::vector<TrackRecord> track_clip(const Clip& clip, Tracker& tracker,
                                    const std::string& video_id,
                                    int output_every = 1,
                                    const SavedFrameFn& on_saved = SavedFrameFn());

nlohmann::ordered_json records_to_json(const std::vector<TrackRecord>& records);
void save_records(const std::string& path, const std::vector<TrackRecord>& records);

/** Records per track id, in the order they were emitted. */
std::map<int, std::vector<TrackRecord>> group_tubes(const std::vector<TrackRecord>& records);
