#include "Track.hpp"
#include <stdexcept>
#include <string>

Track::Track(int id, const Detection& det)
    : id_(id), score_(det.score)
{
    if (!kf_.update(det.box))
        throw std::invalid_argument("Track " + std::to_string(id) + ": degenerate seed box");
}

void Track::predict()
{
    kf_.predict();
    age_++;
    time_since_update_++;
}

bool Track::update(const Detection& det)
{
    if (!kf_.update(det.box)) return false;
    score_ = det.score;
    hits_++;
    time_since_update_ = 0;
    return true;
}
