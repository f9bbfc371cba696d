#pragma once
#include "BoxGeometry.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct Association
{
    std::vector<std::pair<int, int>> matches;              // (track index, detection index)
    std::vector<int>                 unmatched_tracks;     // ascending
    std::vector<int>                 unmatched_detections; // ascending
};

/** rows = a, cols = b */
std::vector<std::vector<double>> iou_matrix(const std::vector<Box>& a,
                                            const std::vector<Box>& b);

/**
 * Matches predicted track boxes to detection boxes. A pair is only ever
 * accepted with IoU >= match_thresh. Empty inputs are valid.
 */
class Associator
{
public:
    virtual ~Associator() = default;

    virtual Association associate(const std::vector<Box>& tracks,
                                  const std::vector<Box>& dets,
                                  double match_thresh) const = 0;

    virtual std::string name() const = 0;
};

/**
 * Tracks are visited in list order; each takes the still-free detection
 * with the highest IoU. Order dependent, not globally optimal.
 */
class GreedyIouAssociator : public Associator
{
public:
    Association associate(const std::vector<Box>& tracks,
                          const std::vector<Box>& dets,
                          double match_thresh) const override;
    std::string name() const override { return "greedy"; }
};

/** Minimum total (1 - IoU) assignment; pairs below match_thresh are forbidden. */
class HungarianIouAssociator : public Associator
{
public:
    Association associate(const std::vector<Box>& tracks,
                          const std::vector<Box>& dets,
                          double match_thresh) const override;
    std::string name() const override { return "hungarian"; }
};

/** "greedy" or "hungarian"; anything else throws std::invalid_argument. */
std::unique_ptr<Associator> make_associator(const std::string& name);

/**
 * Square min-cost assignment. Returns the column assigned to each row.
 * Throws std::invalid_argument for a non-square matrix.
 */
std::vector<int> solve_assignment(const std::vector<std::vector<double>>& cost);
