#include "Associator.hpp"
#include <limits>
#include <stdexcept>

using namespace std;

namespace {

// Cost of a forbidden pair. Large enough to never beat leaving both sides unmatched.
const double FORBIDDEN = 1e6;

Association collect_unmatched(Association a, size_t n_tracks, size_t n_dets)
{
    vector<char> t_used(n_tracks, false), d_used(n_dets, false);
    for (const auto& [t, d] : a.matches) {
        t_used[t] = true;
        d_used[d] = true;
    }
    for (size_t t = 0; t < n_tracks; ++t) if (!t_used[t]) a.unmatched_tracks.push_back(int(t));
    for (size_t d = 0; d < n_dets; ++d)   if (!d_used[d]) a.unmatched_detections.push_back(int(d));
    return a;
}

}  // namespace

vector<vector<double>> iou_matrix(const vector<Box>& a, const vector<Box>& b)
{
    vector<vector<double>> m(a.size(), vector<double>(b.size(), 0.0));
    for (size_t i = 0; i < a.size(); ++i)
        for (size_t j = 0; j < b.size(); ++j)
            m[i][j] = iou(a[i], b[j]);
    return m;
}

// -------- greedy --------------

Association GreedyIouAssociator::associate(const vector<Box>& tracks,
                                           const vector<Box>& dets,
                                           double match_thresh) const
{
    auto ious = iou_matrix(tracks, dets);
    vector<char> taken(dets.size(), false);
    Association out;

    for (size_t ti = 0; ti < tracks.size(); ++ti) {
        int best = -1;
        double best_iou = -1.0;
        for (size_t di = 0; di < dets.size(); ++di) {
            if (taken[di]) continue;
            if (ious[ti][di] > best_iou) {
                best_iou = ious[ti][di];
                best = int(di);
            }
        }
        if (best >= 0 && best_iou >= match_thresh) {
            taken[best] = true;
            out.matches.emplace_back(int(ti), best);
        }
    }
    return collect_unmatched(std::move(out), tracks.size(), dets.size());
}

// -------- optimal assignment --------------

vector<int> solve_assignment(const vector<vector<double>>& cost)
{
    const size_t n = cost.size();
    for (const auto& row : cost)
        if (row.size() != n)
            throw invalid_argument("solve_assignment: cost matrix must be square");
    if (n == 0) return {};

    // Shortest augmenting paths with row/column potentials. Index 0 is a
    // virtual column used as the root of each search; real rows and
    // columns are 1-based inside this function.
    const double INF = numeric_limits<double>::infinity();
    vector<double> row_pot(n + 1, 0.0), col_pot(n + 1, 0.0);
    vector<size_t> owner(n + 1, 0);      // owner[c]: row holding column c, 0 = free
    vector<size_t> via(n + 1, 0);        // previous column on the augmenting path

    for (size_t r = 1; r <= n; ++r) {
        owner[0] = r;
        size_t col = 0;
        vector<double> slack(n + 1, INF);
        vector<char> done(n + 1, false);

        while (owner[col] != 0) {
            done[col] = true;
            size_t row = owner[col], next = 0;
            double delta = INF;
            for (size_t c = 1; c <= n; ++c) {
                if (done[c]) continue;
                double reduced = cost[row - 1][c - 1] - row_pot[row] - col_pot[c];
                if (reduced < slack[c]) {
                    slack[c] = reduced;
                    via[c] = col;
                }
                if (slack[c] < delta) {
                    delta = slack[c];
                    next = c;
                }
            }
            for (size_t c = 0; c <= n; ++c) {
                if (done[c]) {
                    row_pot[owner[c]] += delta;
                    col_pot[c] -= delta;
                } else {
                    slack[c] -= delta;
                }
            }
            col = next;
        }
        // flip the path back to the root
        while (col != 0) {
            size_t prev = via[col];
            owner[col] = owner[prev];
            col = prev;
        }
    }

    vector<int> row_to_col(n, -1);
    for (size_t c = 1; c <= n; ++c)
        if (owner[c] != 0) row_to_col[owner[c] - 1] = int(c - 1);
    return row_to_col;
}

Association HungarianIouAssociator::associate(const vector<Box>& tracks,
                                              const vector<Box>& dets,
                                              double match_thresh) const
{
    const size_t nT = tracks.size(), nD = dets.size();
    if (nT == 0 || nD == 0) return collect_unmatched({}, nT, nD);

    auto ious = iou_matrix(tracks, dets);

    // Extended (nT + nD) square problem: a track or detection may stay
    // unmatched at half the cost limit, so a real pair is only chosen when
    // its cost is below the limit.
    const double limit = 1.0 - match_thresh;
    const size_t N = nT + nD;
    vector<vector<double>> cost(N, vector<double>(N, 0.0));
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = 0; j < N; ++j) {
            if (i < nT && j < nD)
                cost[i][j] = ious[i][j] >= match_thresh ? 1.0 - ious[i][j] : FORBIDDEN;
            else if (i < nT || j < nD)
                cost[i][j] = limit * 0.5;
        }
    }

    auto row_to_col = solve_assignment(cost);

    Association out;
    for (size_t i = 0; i < nT; ++i) {
        int j = row_to_col[i];
        if (j >= 0 && size_t(j) < nD && ious[i][j] >= match_thresh)
            out.matches.emplace_back(int(i), j);
    }
    return collect_unmatched(std::move(out), nT, nD);
}

unique_ptr<Associator> make_associator(const string& name)
{
    if (name == "greedy")    return make_unique<GreedyIouAssociator>();
    if (name == "hungarian") return make_unique<HungarianIouAssociator>();
    throw invalid_argument("unknown associator '" + name + "' (expected greedy or hungarian)");
}
