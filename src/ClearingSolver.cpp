#include "ClearingSolver.hpp"
#include "MarketErrors.hpp"
#include <bitset>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

using namespace std;

namespace {

// Buyer subsets and neighbour sets are held as 64-bit masks.
constexpr int kMaxBuyers = 63;

int bit_count(uint64_t mask) { return static_cast<int>(bitset<64>(mask).count()); }

vector<int> mask_to_indices(uint64_t mask)
{
    vector<int> out;
    for (int j = 0; mask != 0; ++j, mask >>= 1)
        if (mask & 1u) out.push_back(j);
    return out;
}

} // namespace

ClearingSolver::ClearingSolver(ValuationModel model)
    : model_(std::move(model)), state_(SolverState::Adjusting), iterations_(0)
{
    if (model_.size() > kMaxBuyers) {
        throw InvalidShapeError("subset enumeration supports at most "
                                + to_string(kMaxBuyers) + " buyers, got "
                                + to_string(model_.size()));
    }
}

// -------- preference graph ---------------

PreferenceGraph ClearingSolver::preference_graph_of(const cv::Mat1i& adjusted)
{
    if (adjusted.empty())
        throw InvalidShapeError("adjusted matrix has no buyers or no products");

    PreferenceGraph graph(adjusted.rows);
    for (int i = 0; i < adjusted.rows; ++i) {
        const int* row = adjusted[i];

        // first pass for the maximum, second pass for everything tied with it
        int best = row[0];
        for (int j = 1; j < adjusted.cols; ++j) best = max(best, row[j]);
        for (int j = 0; j < adjusted.cols; ++j)
            if (row[j] == best) graph[i].push_back(j);
    }
    return graph;
}

void ClearingSolver::build_preference_graph()
{
    graph_ = preference_graph_of(model_.adjusted());
}

// -------- Hall's condition ---------------

vector<int> ClearingSolver::find_hall_violation() const
{
    return find_hall_violation(graph_);
}

vector<int> ClearingSolver::find_hall_violation(const PreferenceGraph& graph)
{
    const int n = static_cast<int>(graph.size());
    if (n > kMaxBuyers) {
        throw InvalidShapeError("subset enumeration supports at most "
                                + to_string(kMaxBuyers) + " buyers, got "
                                + to_string(n));
    }

    vector<uint64_t> neighbours(n, 0);
    for (int i = 0; i < n; ++i) {
        if (graph[i].empty())
            throw InvalidShapeError("buyer " + to_string(i) + " has no preferred product");
        for (int j : graph[i]) {
            if (j < 0 || j >= n)
                throw OutOfRangeError("buyer " + to_string(i) + " prefers product "
                                      + to_string(j) + " outside [0, "
                                      + to_string(n) + ")");
            neighbours[i] |= uint64_t(1) << j;
        }
    }

    const uint64_t end = uint64_t(1) << n;
    for (uint64_t subset = 1; subset < end; ++subset) {
        uint64_t reached = 0;
        for (int i = 0; i < n; ++i)
            if (subset & (uint64_t(1) << i)) reached |= neighbours[i];

        if (bit_count(reached) < bit_count(subset)) return mask_to_indices(reached);
    }
    return {};
}

// -------- price adjustment ---------------

void ClearingSolver::resolve_violation(const vector<int>& products)
{
    for (int j : products) model_.increment_price(j);
    model_.normalize_prices();
}

const vector<int>& ClearingSolver::solve()
{
    state_ = SolverState::Adjusting;
    iterations_ = 0;
    while (true) {
        model_.recompute_adjusted_matrix();
        build_preference_graph();
        vector<int> constricted = find_hall_violation();
        if (constricted.empty()) break;
        resolve_violation(constricted);
        ++iterations_;
    }
    state_ = SolverState::Converged;
    return model_.prices();
}

// -------- validation ---------------------

bool ClearingSolver::refresh_and_check()
{
    model_.recompute_adjusted_matrix();
    build_preference_graph();
    bool clears = find_hall_violation().empty();
    state_ = clears ? SolverState::Converged : SolverState::Adjusting;
    return clears;
}

bool ClearingSolver::is_valid_price_vector(const vector<int>& candidate)
{
    if (static_cast<int>(candidate.size()) != model_.size()) return false;
    adopt_price_vector(candidate);
    return refresh_and_check();
}

bool ClearingSolver::check_clears(const vector<int>& candidate) const
{
    const int n = model_.size();
    if (static_cast<int>(candidate.size()) != n) return false;

    cv::Mat1i adjusted(n, n);
    for (int i = 0; i < n; ++i)
        for (int j = 0; j < n; ++j)
            adjusted(i, j) = model_.original()(i, j) - candidate[j];

    return find_hall_violation(preference_graph_of(adjusted)).empty();
}

void ClearingSolver::adopt_price_vector(const vector<int>& candidate)
{
    model_.set_prices(candidate);
    state_ = SolverState::Adjusting;
}

// -------- assignment ---------------------

Assignment ClearingSolver::find_assignment() const
{
    return find_assignment(graph_);
}

// Kuhn's augmenting paths over the preferred-product edges.
Assignment ClearingSolver::find_assignment(const PreferenceGraph& graph)
{
    const int n = static_cast<int>(graph.size());
    vector<int> owner(n, -1);   // product -> buyer
    vector<char> seen;

    function<bool(int)> augment = [&](int buyer) -> bool {
        for (int j : graph[buyer]) {
            if (j < 0 || j >= n || seen[j]) continue;
            seen[j] = true;
            if (owner[j] == -1 || augment(owner[j])) {
                owner[j] = buyer;
                return true;
            }
        }
        return false;
    };

    for (int i = 0; i < n; ++i) {
        seen.assign(n, false);
        if (!augment(i)) return {};
    }

    Assignment assignment(n, -1);
    for (int j = 0; j < n; ++j) assignment[owner[j]] = j;
    return assignment;
}
