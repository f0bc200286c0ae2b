#pragma once
#include <opencv2/core.hpp>
#include <vector>

/**
 * Valuations of n buyers for n products, together with the current price
 * vector and the valuation matrix adjusted by those prices.
 *
 * The original matrix never changes after construction. The adjusted matrix
 * is only refreshed by recompute_adjusted_matrix().
 */
class ValuationModel
{
public:
    /** Random market: valuations drawn uniformly from [0, max_valuation]. */
    ValuationModel(int number_of_buyers, int max_valuation, cv::RNG& rng);

    /** Market with the given square matrix (copied). */
    explicit ValuationModel(const cv::Mat1i& valuations);
    explicit ValuationModel(const std::vector<std::vector<int>>& valuations);

    // cv::Mat copies share their buffer; a copied model gets its own.
    ValuationModel(const ValuationModel& other);
    ValuationModel& operator=(const ValuationModel& other);
    ValuationModel(ValuationModel&&) = default;
    ValuationModel& operator=(ValuationModel&&) = default;

    int size() const { return n_; }

    int original_value(int buyer, int product) const;
    int adjusted_value(int buyer, int product) const;
    int price(int product) const;

    void recompute_adjusted_matrix();
    void increment_price(int product);
    void normalize_prices();
    void set_prices(const std::vector<int>& prices);

    const cv::Mat1i&        original() const { return original_; }
    const cv::Mat1i&        adjusted() const { return adjusted_; }
    const std::vector<int>& prices()   const { return prices_; }

private:
    void check_buyer(int buyer) const;
    void check_product(int product) const;

    int              n_;
    cv::Mat1i        original_;
    cv::Mat1i        adjusted_;
    std::vector<int> prices_;
};
