#pragma once
#include "BoxGeometry.hpp"
#include <opencv2/video/tracking.hpp>

/**
 * Constant-velocity Kalman filter over one bounding box.
 *
 * State (8x1):       [cx, cy, a, h, vcx, vcy, va, vh]   a = width / height
 * Measurement (4x1): [cx, cy, a, h]
 *
 * The filter starts uninitialised; the first update() seeds the position
 * terms from the measurement with zero velocity.
 */
class KalmanBoxFilter
{
public:
    KalmanBoxFilter();

    /** Advance one frame. No-op until the first update(). */
    void predict();

    /**
     * Correct with a measurement. Returns false, leaving the state as it
     * was, for a non-finite or zero-height measurement or when the
     * innovation covariance is not positive definite.
     */
    bool update(const cv::Mat& z);
    bool update(const Box& b);

    bool    initialized() const { return initialized_; }
    Box     box() const;
    cv::Mat state() const { return kf_.statePost.clone(); }
    cv::Mat covariance() const { return kf_.errorCovPost.clone(); }

    /** [cx, cy, a, h] column vector, or an empty Mat for a degenerate box. */
    static cv::Mat measurement_from_box(const Box& b);
    static Box     box_from_state(const cv::Mat& x);

private:
    void init(const cv::Mat& z);

    cv::KalmanFilter kf_;
    bool             initialized_ = false;
};
