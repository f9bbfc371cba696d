#pragma once
#include "Associator.hpp"
#include "BoxGeometry.hpp"
#include "Track.hpp"
#include <memory>
#include <string>
#include <vector>

struct TrackerParams
{
    double      track_thresh = 0.5;      // detections below this never reach association
    double      match_thresh = 0.3;      // minimum IoU to accept a match
    int         max_age      = 30;       // frames a track may coast before it is dropped
    int         min_hits     = 3;        // hits before a track is first reported
    double      nms_thresh   = 0.7;      // de-duplication IoU, 0 disables
    std::string associator   = "greedy";
};

struct Label            // what we emit each frame
{
    int track_id;
    Box bbox;           // from the filter posterior
};

/**
 * Per-clip multi-object tracker. Frames must be fed in temporal order;
 * one instance per clip, never shared between threads.
 */
class Tracker
{
public:
    explicit Tracker(const TrackerParams& params = TrackerParams());
    Tracker(const TrackerParams& params, std::unique_ptr<Associator> associator);

    /** Process one frame, return the tracks that are reportable this frame. */
    std::vector<Label> update(const std::vector<Detection>& dets);

    const std::vector<Track>& tracks() const { return tracks_; }
    const TrackerParams&      params() const { return params_; }
    const Associator&         associator() const { return *associator_; }
    int                       frame_count() const { return frame_count_; }
    int                       rejected_updates() const { return rejected_updates_; }

private:
    std::vector<Detection> select_candidates(const std::vector<Detection>& dets) const;
    bool                   reportable(const Track& t) const;

    TrackerParams               params_;
    std::unique_ptr<Associator> associator_;
    std::vector<Track>          tracks_;
    int                         next_id_     = 1;
    int                         frame_count_ = 0;
    int                         rejected_updates_ = 0;   // matches the filter refused
};
