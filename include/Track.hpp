#pragma once
#include "BoxGeometry.hpp"
#include "KalmanBoxFilter.hpp"

/**
 * One identity followed across frames. Owned by its Tracker; the id is
 * handed out by that Tracker and never changes.
 */
class Track
{
public:
    Track(int id, const Detection& det);

    /** Dead-reckon one frame: ages the track whether or not it is matched later. */
    void predict();

    /** Fold a matched detection in. False if the filter rejected it. */
    bool update(const Detection& det);

    int    id()                const { return id_; }
    int    hits()              const { return hits_; }
    int    age()               const { return age_; }
    int    time_since_update() const { return time_since_update_; }
    double score()             const { return score_; }
    Box    box()               const { return kf_.box(); }

    const KalmanBoxFilter& filter() const { return kf_; }

private:
    int             id_;
    KalmanBoxFilter kf_;
    double          score_             = 0.0;   // of the last matched detection
    int             hits_              = 1;
    int             age_               = 1;
    int             time_since_update_ = 0;
};
