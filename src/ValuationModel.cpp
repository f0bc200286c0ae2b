#include "ValuationModel.hpp"
#include "MarketErrors.hpp"
#include <algorithm>
#include <string>

using namespace std;

// -------- construction -------------------

ValuationModel::ValuationModel(int number_of_buyers, int max_valuation, cv::RNG& rng)
    : n_(number_of_buyers)
{
    if (number_of_buyers < 1)
        throw InvalidShapeError("number of buyers must be at least 1, got "
                                + to_string(number_of_buyers));
    if (max_valuation < 0)
        throw InvalidShapeError("max valuation must be non-negative, got "
                                + to_string(max_valuation));

    original_.create(n_, n_);
    for (int i = 0; i < n_; ++i)
        for (int j = 0; j < n_; ++j)
            original_(i, j) = rng.uniform(0, max_valuation + 1); // [0, max]

    adjusted_ = original_.clone();
    prices_.assign(n_, 0);
}

ValuationModel::ValuationModel(const cv::Mat1i& valuations)
    : n_(valuations.rows)
{
    if (valuations.empty() || valuations.rows != valuations.cols) {
        throw InvalidShapeError("valuation matrix must be square and non-empty, got "
                                + to_string(valuations.rows) + "x"
                                + to_string(valuations.cols));
    }
    original_ = valuations.clone();
    adjusted_ = original_.clone();
    prices_.assign(n_, 0);
}

ValuationModel::ValuationModel(const vector<vector<int>>& valuations)
    : n_(static_cast<int>(valuations.size()))
{
    if (valuations.empty())
        throw InvalidShapeError("valuation matrix must be non-empty");

    original_.create(n_, n_);
    for (int i = 0; i < n_; ++i) {
        if (static_cast<int>(valuations[i].size()) != n_) {
            throw InvalidShapeError("valuation matrix must be square: row "
                                    + to_string(i) + " has "
                                    + to_string(valuations[i].size())
                                    + " entries, expected " + to_string(n_));
        }
        for (int j = 0; j < n_; ++j) original_(i, j) = valuations[i][j];
    }
    adjusted_ = original_.clone();
    prices_.assign(n_, 0);
}

ValuationModel::ValuationModel(const ValuationModel& other)
    : n_(other.n_),
      original_(other.original_.clone()),
      adjusted_(other.adjusted_.clone()),
      prices_(other.prices_) {}

ValuationModel& ValuationModel::operator=(const ValuationModel& other)
{
    if (this != &other) {
        n_        = other.n_;
        original_ = other.original_.clone();
        adjusted_ = other.adjusted_.clone();
        prices_   = other.prices_;
    }
    return *this;
}

// -------- bounds checks ------------------

void ValuationModel::check_buyer(int buyer) const
{
    if (buyer < 0 || buyer >= n_)
        throw OutOfRangeError("buyer index " + to_string(buyer)
                              + " outside [0, " + to_string(n_) + ")");
}

void ValuationModel::check_product(int product) const
{
    if (product < 0 || product >= n_)
        throw OutOfRangeError("product index " + to_string(product)
                              + " outside [0, " + to_string(n_) + ")");
}

// -------- reads --------------------------

int ValuationModel::original_value(int buyer, int product) const
{
    check_buyer(buyer);
    check_product(product);
    return original_(buyer, product);
}

int ValuationModel::adjusted_value(int buyer, int product) const
{
    check_buyer(buyer);
    check_product(product);
    return original_(buyer, product) - prices_[product];
}

int ValuationModel::price(int product) const
{
    check_product(product);
    return prices_[product];
}

// -------- price arithmetic ---------------

void ValuationModel::recompute_adjusted_matrix()
{
    for (int i = 0; i < n_; ++i) {
        const int* src = original_[i];
        int*       dst = adjusted_[i];
        for (int j = 0; j < n_; ++j) dst[j] = src[j] - prices_[j];
    }
}

void ValuationModel::increment_price(int product)
{
    check_product(product);
    prices_[product] += 1;
}

// Shifting every price by the same amount keeps each buyer's row maxima.
void ValuationModel::normalize_prices()
{
    int lowest = *min_element(prices_.begin(), prices_.end());
    for (auto& p : prices_) p -= lowest;
}

void ValuationModel::set_prices(const vector<int>& prices)
{
    if (static_cast<int>(prices.size()) != n_) {
        throw InvalidShapeError("price vector has " + to_string(prices.size())
                                + " entries, expected " + to_string(n_));
    }
    prices_ = prices;
}
