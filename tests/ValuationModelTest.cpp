#include "ValuationModel.hpp"
#include "ClearingSolver.hpp"
#include "MarketErrors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace {

std::vector<std::vector<int>> sample3()
{
    return {{6, 5, 2},
            {7, 6, 3},
            {6, 7, 6}};
}

} // namespace

TEST(ValuationModel, RandomMarketStaysWithinBounds)
{
    cv::RNG rng(42);
    ValuationModel model(6, 8, rng);

    ASSERT_EQ(model.size(), 6);
    for (int i = 0; i < 6; ++i) {
        for (int j = 0; j < 6; ++j) {
            EXPECT_GE(model.original_value(i, j), 0);
            EXPECT_LE(model.original_value(i, j), 8);
        }
    }
    EXPECT_EQ(model.prices(), std::vector<int>(6, 0));
}

TEST(ValuationModel, SameSeedGivesSameMarket)
{
    cv::RNG a(7), b(7);
    ValuationModel first(5, 20, a);
    ValuationModel second(5, 20, b);
    EXPECT_EQ(cv::countNonZero(first.original() != second.original()), 0);
}

TEST(ValuationModel, ZeroMaxValuationGivesZeroMatrix)
{
    cv::RNG rng(3);
    ValuationModel model(4, 0, rng);
    EXPECT_EQ(cv::countNonZero(model.original()), 0);
}

TEST(ValuationModel, RejectsBadShapes)
{
    cv::RNG rng(1);
    EXPECT_THROW(ValuationModel(0, 5, rng), InvalidShapeError);
    EXPECT_THROW(ValuationModel(3, -1, rng), InvalidShapeError);
    EXPECT_THROW(ValuationModel(std::vector<std::vector<int>>{}), InvalidShapeError);
    EXPECT_THROW(ValuationModel(std::vector<std::vector<int>>{{1, 2}, {3}}), InvalidShapeError);
    EXPECT_THROW(ValuationModel{cv::Mat1i(2, 3, 0)}, InvalidShapeError);
    EXPECT_THROW(ValuationModel{cv::Mat1i()}, InvalidShapeError);
}

TEST(ValuationModel, AdjustedValueSubtractsPrice)
{
    ValuationModel model(sample3());
    model.increment_price(0);
    model.increment_price(0);

    EXPECT_EQ(model.price(0), 2);
    EXPECT_EQ(model.adjusted_value(1, 0), 5);
    EXPECT_EQ(model.adjusted_value(2, 1), 7);

    // the stored matrix only moves on recompute
    EXPECT_EQ(model.adjusted()(1, 0), 7);
    model.recompute_adjusted_matrix();
    EXPECT_EQ(model.adjusted()(1, 0), 5);
    EXPECT_EQ(model.adjusted()(0, 0), 4);
    EXPECT_EQ(model.original()(1, 0), 7);
}

TEST(ValuationModel, IndexesAreChecked)
{
    ValuationModel model(sample3());
    EXPECT_THROW(model.adjusted_value(3, 0), OutOfRangeError);
    EXPECT_THROW(model.adjusted_value(0, -1), OutOfRangeError);
    EXPECT_THROW(model.original_value(-1, 0), OutOfRangeError);
    EXPECT_THROW(model.increment_price(3), OutOfRangeError);
    EXPECT_THROW(model.price(5), OutOfRangeError);
}

TEST(ValuationModel, NormalizeShiftsMinimumToZero)
{
    ValuationModel model(sample3());
    model.set_prices({3, 5, 4});
    model.normalize_prices();

    EXPECT_EQ(model.prices(), (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(*std::min_element(model.prices().begin(), model.prices().end()), 0);
}

TEST(ValuationModel, NormalizeKeepsRowMaxima)
{
    ValuationModel model(sample3());
    model.set_prices({4, 3, 1});
    model.recompute_adjusted_matrix();
    PreferenceGraph before = ClearingSolver::preference_graph_of(model.adjusted());

    model.normalize_prices();
    model.recompute_adjusted_matrix();
    PreferenceGraph after = ClearingSolver::preference_graph_of(model.adjusted());

    EXPECT_EQ(before, after);
    EXPECT_EQ(model.prices(), (std::vector<int>{3, 2, 0}));
}

TEST(ValuationModel, SetPricesChecksLength)
{
    ValuationModel model(sample3());
    EXPECT_THROW(model.set_prices({1, 2}), InvalidShapeError);
    EXPECT_EQ(model.prices(), std::vector<int>(3, 0));
}

TEST(ValuationModel, CopiesDoNotShareMatrices)
{
    ValuationModel model(sample3());
    ValuationModel copy(model);

    copy.increment_price(1);
    copy.recompute_adjusted_matrix();

    EXPECT_EQ(copy.adjusted()(2, 1), 6);
    EXPECT_EQ(model.adjusted()(2, 1), 7);
    EXPECT_EQ(model.price(1), 0);
}
