#include "KalmanBoxFilter.hpp"
#include <opencv2/core.hpp>

using namespace std;

namespace {

// Per-frame process noise: tight on position/shape, loose on velocity.
const double Q_DIAG[8] = {1e-2, 1e-2, 1e-6, 1e-2, 1.0, 1.0, 1e-4, 1.0};
// Measurement noise. The aspect term is dimensionless.
const double R_DIAG[4] = {1.0, 1.0, 1e-3, 1.0};
// Initial covariance: measurement-sized on position, unknown velocity.
const double P0_DIAG[8] = {10.0, 10.0, 1e-2, 10.0, 1e4, 1e4, 1e-1, 1e4};

cv::Mat diag(const double* v, int n)
{
    cv::Mat m = cv::Mat::zeros(n, n, CV_64F);
    for (int i = 0; i < n; ++i) m.at<double>(i, i) = v[i];
    return m;
}

}  // namespace

KalmanBoxFilter::KalmanBoxFilter()
    : kf_(8, 4, 0, CV_64F)
{
    // Transition matrix (F): each of the leading four terms advances by its velocity
    kf_.transitionMatrix = cv::Mat::eye(8, 8, CV_64F);
    for (int i = 0; i < 4; ++i) kf_.transitionMatrix.at<double>(i, i + 4) = 1.0;

    // Measurement matrix (H)
    kf_.measurementMatrix = cv::Mat::zeros(4, 8, CV_64F);
    for (int i = 0; i < 4; ++i) kf_.measurementMatrix.at<double>(i, i) = 1.0;

    kf_.processNoiseCov     = diag(Q_DIAG, 8);
    kf_.measurementNoiseCov = diag(R_DIAG, 4);
    kf_.errorCovPost        = diag(P0_DIAG, 8);
    kf_.errorCovPre         = kf_.errorCovPost.clone();
    kf_.statePost           = cv::Mat::zeros(8, 1, CV_64F);
    kf_.statePre            = cv::Mat::zeros(8, 1, CV_64F);
}

void KalmanBoxFilter::init(const cv::Mat& z)
{
    kf_.statePost = cv::Mat::zeros(8, 1, CV_64F);
    for (int i = 0; i < 4; ++i) kf_.statePost.at<double>(i) = z.at<double>(i);
    kf_.statePost.copyTo(kf_.statePre);
    kf_.errorCovPost = diag(P0_DIAG, 8);
    kf_.errorCovPost.copyTo(kf_.errorCovPre);
    initialized_ = true;
}

void KalmanBoxFilter::predict()
{
    if (!initialized_) return;
    // cv::KalmanFilter copies the prior into statePost/errorCovPost, so
    // repeated predict() calls dead-reckon without a correction.
    kf_.predict();
}

bool KalmanBoxFilter::update(const cv::Mat& z_in)
{
    if (z_in.total() != 4) return false;
    cv::Mat z;
    z_in.reshape(1, 4).convertTo(z, CV_64F);
    if (!cv::checkRange(z) || z.at<double>(3) <= 0.0) return false;

    if (!initialized_) {
        init(z);
        return true;
    }

    const cv::Mat& H = kf_.measurementMatrix;
    cv::Mat S = H * kf_.errorCovPre * H.t() + kf_.measurementNoiseCov;
    cv::Mat S_inv;
    if (!cv::checkRange(S) || cv::invert(S, S_inv, cv::DECOMP_CHOLESKY) == 0)
        return false;

    kf_.correct(z);
    // an innovation that overflows leaves the posterior non-finite: keep the prior
    if (!cv::checkRange(kf_.statePost) || !cv::checkRange(kf_.errorCovPost)) {
        kf_.statePre.copyTo(kf_.statePost);
        kf_.errorCovPre.copyTo(kf_.errorCovPost);
        return false;
    }
    // keep the prior in step so a second correction in one frame composes
    kf_.statePost.copyTo(kf_.statePre);
    kf_.errorCovPost.copyTo(kf_.errorCovPre);
    return true;
}

bool KalmanBoxFilter::update(const Box& b)
{
    cv::Mat z = measurement_from_box(b);
    return !z.empty() && update(z);
}

Box KalmanBoxFilter::box() const
{
    return box_from_state(kf_.statePost);
}

cv::Mat KalmanBoxFilter::measurement_from_box(const Box& b)
{
    if (is_degenerate(b)) return cv::Mat();
    cv::Mat z(4, 1, CV_64F);
    z.at<double>(0) = b.x1 + b.width() * 0.5;
    z.at<double>(1) = b.y1 + b.height() * 0.5;
    z.at<double>(2) = aspect_ratio(b);
    z.at<double>(3) = b.height();
    return z;
}

Box KalmanBoxFilter::box_from_state(const cv::Mat& x)
{
    double cx = x.at<double>(0), cy = x.at<double>(1);
    double a  = x.at<double>(2), h  = x.at<double>(3);
    double w  = a * h;
    return {cx - w * 0.5, cy - h * 0.5, cx + w * 0.5, cy + h * 0.5};
}
