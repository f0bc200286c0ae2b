#pragma once
#include "ValuationModel.hpp"
#include <vector>

/** buyer -> products tied for that buyer's best adjusted valuation */
using PreferenceGraph = std::vector<std::vector<int>>;

/** buyer -> product; empty when no perfect matching exists */
using Assignment = std::vector<int>;

enum class SolverState { Adjusting, Converged };

/**
 * Raises prices on constricted product sets until every buyer can be given a
 * distinct product among the ones she prefers at current prices.
 *
 * Hall's condition is checked directly over all 2^n - 1 buyer subsets, so the
 * solver is meant for small markets.
 */
class ClearingSolver
{
public:
    explicit ClearingSolver(ValuationModel model);

    /**
     * Run the adjustment loop to convergence, return the clearing prices.
     * iterations() counts the price rounds of the latest call only.
     */
    const std::vector<int>& solve();

    void build_preference_graph();

    /**
     * Neighbour set N(S) of the first buyer subset S with |N(S)| < |S|,
     * sorted ascending. Empty when Hall's condition holds.
     * Subsets are visited in bitmask order: {0}, {1}, {0,1}, {2}, ...
     * Throws InvalidShapeError if a buyer has no preferred product.
     */
    std::vector<int> find_hall_violation() const;
    static std::vector<int> find_hall_violation(const PreferenceGraph& graph);

    /** Raise the price of every product in the set by one, then normalize. */
    void resolve_violation(const std::vector<int>& products);

    /** Installs candidate as the live price vector, then checks it. */
    bool is_valid_price_vector(const std::vector<int>& candidate);

    /** Same answer as is_valid_price_vector, without touching solver state. */
    bool check_clears(const std::vector<int>& candidate) const;

    void adopt_price_vector(const std::vector<int>& candidate);

    /** Perfect matching inside the current preference graph. */
    Assignment find_assignment() const;
    static Assignment find_assignment(const PreferenceGraph& graph);

    /** Throws InvalidShapeError for a matrix without rows or columns. */
    static PreferenceGraph preference_graph_of(const cv::Mat1i& adjusted);

    const ValuationModel&   model()            const { return model_; }
    const PreferenceGraph&  preference_graph() const { return graph_; }
    const std::vector<int>& price_vector()     const { return model_.prices(); }
    SolverState             state()            const { return state_; }
    int                     iterations()       const { return iterations_; }

private:
    bool refresh_and_check();

    ValuationModel  model_;
    PreferenceGraph graph_;
    SolverState     state_;
    int             iterations_;
};
