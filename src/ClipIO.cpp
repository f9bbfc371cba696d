#include "ClipIO.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

// Longest run of missing frames filled in between two listed ones.
static const int MAX_FRAME_GAP = 100000;

// -------- parsing --------------

static Box box_from(const json& a)
{
    if (!a.is_array() || a.size() < 4)
        throw runtime_error("bbox must be [x1, y1, x2, y2], got " + a.dump());
    return {a[0].get<double>(), a[1].get<double>(), a[2].get<double>(), a[3].get<double>()};
}

Detection parse_detection(const json& j)
{
    Detection d;
    if (j.is_array()) {
        if (j.size() != 5 && j.size() != 6)
            throw runtime_error("detection tuple must have 5 or 6 values, got " + j.dump());
        d.box   = box_from(j);
        d.score = j[4].get<double>();
        if (j.size() == 6) d.class_id = j[5].get<int>();
        return d;
    }
    if (!j.is_object())
        throw runtime_error("detection must be an array or an object, got " + j.dump());

    if (j.contains("bbox"))      d.box = box_from(j.at("bbox"));
    else if (j.contains("xyxy")) d.box = box_from(j.at("xyxy"));
    else throw runtime_error("detection without bbox: " + j.dump());

    if (j.contains("score"))           d.score = j.at("score").get<double>();
    else if (j.contains("confidence")) d.score = j.at("confidence").get<double>();
    else                               d.score = 1.0;

    if (j.contains("class_id") && !j.at("class_id").is_null())
        d.class_id = j.at("class_id").get<int>();
    return d;
}

Clip parse_clip(const json& j, int person_class)
{
    if (!j.is_array())
        throw runtime_error("clip must be a JSON array of frames");

    Clip clip;
    int idx = 0;
    for (const auto& f : j) {
        Frame fr;
        fr.index = idx;
        try {
            const json* dets = &f;
            if (f.is_object()) {
                if (f.contains("frame")) fr.index = f.at("frame").get<int>();
                dets = &f.at("detections");
            }
            if (fr.index < 0)
                throw runtime_error("negative frame index " + to_string(fr.index));
            if (!dets->is_array())
                throw runtime_error("detections must be an array");

            for (const auto& dj : *dets) {
                Detection d = parse_detection(dj);
                if (person_class >= 0 && d.class_id && *d.class_id != person_class) {
                    clip.filtered++;
                    continue;
                }
                if (is_degenerate(d.box)) {
                    clip.skipped++;
                    continue;
                }
                fr.dets.push_back(d);
            }
        } catch (const json::exception& e) {
            throw runtime_error("frame " + to_string(idx) + ": " + e.what());
        } catch (const runtime_error& e) {
            throw runtime_error("frame " + to_string(idx) + ": " + e.what());
        }
        clip.frames.push_back(std::move(fr));
        idx++;
    }

    // Frames are tracked one step each, in index order. Missing indices
    // become empty frames so coasting tracks age through them.
    stable_sort(clip.frames.begin(), clip.frames.end(),
        [](const Frame& a, const Frame& b) { return a.index < b.index; });
    vector<Frame> ordered;
    ordered.reserve(clip.frames.size());
    for (auto& fr : clip.frames) {
        if (!ordered.empty()) {
            int prev = ordered.back().index;
            if (fr.index == prev)
                throw runtime_error("duplicate frame index " + to_string(fr.index));
            if (fr.index - prev - 1 > MAX_FRAME_GAP)
                throw runtime_error("frame index jumps from " + to_string(prev)
                                    + " to " + to_string(fr.index));
            for (int k = prev + 1; k < fr.index; ++k) {
                Frame empty;
                empty.index = k;
                ordered.push_back(std::move(empty));
                clip.filled++;
            }
        }
        ordered.push_back(std::move(fr));
    }
    clip.frames = std::move(ordered);
    return clip;
}

Clip load_clip(const string& path, int person_class)
{
    ifstream in(path);
    if (!in.is_open())
        throw runtime_error("cannot open clip file: " + path);
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw runtime_error(path + ": " + e.what());
    }
    return parse_clip(j, person_class);
}

// -------- tracking loop --------------

string frame_name(const string& video_id, int saved_idx)
{
    ostringstream fn;
    fn << video_id << "_frame_" << setw(4) << setfill('0') << saved_idx << ".jpg";
    return fn.str();
}

vector<TrackRecord> track_clip(const Clip& clip, Tracker& tracker,
                               const string& video_id, int output_every,
                               const SavedFrameFn& on_saved)
{
    if (output_every < 1)
        throw invalid_argument("output_every must be >= 1, got " + to_string(output_every));

    vector<TrackRecord> records;
    int saved_idx = 0;
    for (size_t i = 0; i < clip.frames.size(); ++i) {
        // every frame is tracked; only sampled frames are written
        vector<Label> labels = tracker.update(clip.frames[i].dets);
        if (i % size_t(output_every) != 0) continue;

        string name = frame_name(video_id, saved_idx);
        for (const auto& l : labels)
            records.push_back({video_id, name, l.track_id, l.bbox});
        if (on_saved) on_saved(saved_idx, labels);
        saved_idx++;
    }
    return records;
}

// -------- output --------------

nlohmann::ordered_json records_to_json(const vector<TrackRecord>& records)
{
    nlohmann::ordered_json j = nlohmann::ordered_json::array();
    for (const auto& r : records) {
        j.push_back({
            {"video_id", r.video_id},
            {"frame",    r.frame},
            {"track_id", r.track_id},
            {"bbox",     {r.bbox.x1, r.bbox.y1, r.bbox.x2, r.bbox.y2}}
        });
    }
    return j;
}

void save_records(const string& path, const vector<TrackRecord>& records)
{
    ofstream out(path);
    if (!out.is_open())
        throw runtime_error("cannot write " + path);
    out << setw(2) << records_to_json(records) << "\n";
}

map<int, vector<TrackRecord>> group_tubes(const vector<TrackRecord>& records)
{
    map<int, vector<TrackRecord>> tubes;
    for (const auto& r : records) tubes[r.track_id].push_back(r);
    return tubes;
}
