#include "Tracker.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

// -------- utility functions --------------

static void validate(const TrackerParams& p)
{
    auto unit = [](double v) { return v >= 0.0 && v <= 1.0; };
    if (!unit(p.track_thresh))
        throw invalid_argument("track_thresh must be in [0, 1], got " + to_string(p.track_thresh));
    if (!unit(p.match_thresh))
        throw invalid_argument("match_thresh must be in [0, 1], got " + to_string(p.match_thresh));
    if (!unit(p.nms_thresh))
        throw invalid_argument("nms_thresh must be in [0, 1], got " + to_string(p.nms_thresh));
    if (p.max_age < 0)
        throw invalid_argument("max_age must be >= 0, got " + to_string(p.max_age));
    if (p.min_hits < 1)
        throw invalid_argument("min_hits must be >= 1, got " + to_string(p.min_hits));
}

// Drops low-confidence and degenerate boxes, then duplicates.
vector<Detection> Tracker::select_candidates(const vector<Detection>& dets) const
{
    vector<Detection> out;
    out.reserve(dets.size());
    for (const auto& d : dets) {
        if (!isfinite(d.score) || d.score < params_.track_thresh) continue;
        // only boxes the filter can seed from, so spawning never throws
        if (KalmanBoxFilter::measurement_from_box(d.box).empty()) continue;
        out.push_back(d);
    }
    if (params_.nms_thresh > 0.0 && out.size() > 1)
        out = greedy_nms(out, params_.nms_thresh);
    return out;
}

bool Tracker::reportable(const Track& t) const
{
    return t.time_since_update() == 0 && t.hits() >= params_.min_hits;
}

// -------- Tracker implementation ------------

Tracker::Tracker(const TrackerParams& params)
    : Tracker(params, make_associator(params.associator)) {}

Tracker::Tracker(const TrackerParams& params, unique_ptr<Associator> associator)
    : params_(params), associator_(std::move(associator))
{
    validate(params_);
    if (!associator_)
        throw invalid_argument("Tracker needs an associator");
    params_.associator = associator_->name();
}

vector<Label> Tracker::update(const vector<Detection>& dets)
{
    frame_count_++;
    vector<Detection> cands = select_candidates(dets);

    // Predict all tracks forward one frame
    vector<Box> predicted;
    predicted.reserve(tracks_.size());
    for (auto& tr : tracks_) {
        tr.predict();
        predicted.push_back(tr.box());
    }

    vector<Box> det_boxes;
    det_boxes.reserve(cands.size());
    for (const auto& d : cands) det_boxes.push_back(d.box);

    Association assoc = associator_->associate(predicted, det_boxes, params_.match_thresh);

    // Update matched tracks. A rejected correction leaves the track coasting.
    for (const auto& [ti, di] : assoc.matches)
        if (!tracks_[ti].update(cands[di])) rejected_updates_++;

    // Add unmatched detections as new tracks
    for (int di : assoc.unmatched_detections)
        tracks_.emplace_back(next_id_++, cands[di]);

    vector<Label> labels;
    for (const auto& t : tracks_)
        if (reportable(t)) labels.push_back({t.id(), t.box()});

    // Remove stale tracks
    tracks_.erase(remove_if(tracks_.begin(), tracks_.end(),
        [&](const Track& t) { return t.time_since_update() > params_.max_age; }),
        tracks_.end());

    return labels;
}
