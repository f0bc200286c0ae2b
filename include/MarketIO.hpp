#pragma once
#include "ClearingSolver.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <iosfwd>
#include <string>
#include <vector>

struct MarketCase
{
    std::string name;
    cv::Mat1i   valuations;
};

/** Value of key in [section] of an .ini file, "" if missing. */
std::string get_ini_value(const std::string& section, const std::string& key,
                          const std::string& path = "defaults.ini");

/** Subsets are enumerated per solver round, so markets are kept small. */
constexpr int kDefaultMaxBuyers = 12;

/**
 * Accepts an array of {"name", "valuations"} objects or a single object.
 * Valuations must be non-negative ints; markets above max_buyers are rejected.
 */
std::vector<MarketCase> parse_markets(const nlohmann::json& j,
                                      int max_buyers = kDefaultMaxBuyers);
std::vector<MarketCase> load_markets(const std::string& path,
                                     int max_buyers = kDefaultMaxBuyers);

/** The 3x3 and 5x5 sample markets. */
std::vector<MarketCase> sample_markets();

nlohmann::ordered_json market_report(const std::string& name,
                                     const ClearingSolver& solver,
                                     bool valid);
void save_report(const std::string& path, const nlohmann::ordered_json& report);

void print_matrix(std::ostream& out, const std::string& title, const cv::Mat1i& m);
void print_prices(std::ostream& out, const std::vector<int>& prices);

/** Buyers on the left, products on the right, preferred edges in between. */
cv::Mat render_preference_graph(const ClearingSolver& solver,
                                int W = 800, int H = 600);
void draw_vis(const std::string& dir, int idx, const ClearingSolver& solver);
