#include "ClearingSolver.hpp"
#include "MarketIO.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------

static void report_market(const std::string& name, const ClearingSolver& solver, bool valid)
{
    std::cout << name << " (" << solver.model().size() << " buyers, "
              << solver.iterations() << " price rounds)\n";
    print_matrix(std::cout, "Original valuation matrix", solver.model().original());
    print_matrix(std::cout, "Adjusted valuation matrix", solver.model().adjusted());
    print_prices(std::cout, solver.price_vector());
    std::cout << "Is the calculated price vector valid? " << (valid ? "true" : "false") << "\n";

    Assignment assignment = solver.find_assignment();
    if (!assignment.empty()) {
        std::cout << "Assignment:";
        for (size_t i = 0; i < assignment.size(); ++i)
            std::cout << " " << i << "->" << assignment[i];
        std::cout << "\n";
    }
    std::cout << "-------" << std::endl;
}

// Read one [market] default, announcing the keys the file provides.
static std::string market_default(const std::string& key, const std::string& ini_path)
{
    std::string value = get_ini_value("market", key, ini_path);
    if (!value.empty())
        std::cout << "loading [market][" << key << "] from " << ini_path << std::endl;
    return value;
}

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    std::string ini_path = "defaults.ini";
    {
        // --ini has to be known before the other defaults are read
        CLI::App pre;
        pre.allow_extras();
        pre.set_help_flag();
        pre.add_option("--ini", ini_path);
        try { pre.parse(argc, argv); }
        catch (const CLI::ParseError& e) { return pre.exit(e); }
    }

    // Read defaults from .ini
    std::string ini_in     = market_default("input", ini_path);
    std::string ini_out    = market_default("output", ini_path);
    std::string ini_vis    = market_default("vis-dir", ini_path);
    std::string ini_buyers = market_default("buyers", ini_path);
    std::string ini_maxval = market_default("max-valuation", ini_path);
    std::string ini_maxbuy = market_default("max-buyers", ini_path);
    std::string ini_seed   = market_default("seed", ini_path);

    // Defaults for CLI
    std::string in_path  = ini_in;
    std::string out_path = ini_out;
    std::string vis_dir  = ini_vis;
    int buyers           = ini_buyers.empty() ? 4 : std::stoi(ini_buyers);
    int max_valuation    = ini_maxval.empty() ? 8 : std::stoi(ini_maxval);
    int max_buyers       = ini_maxbuy.empty() ? kDefaultMaxBuyers : std::stoi(ini_maxbuy);
    std::uint64_t seed   = ini_seed.empty()   ? 0 : std::stoull(ini_seed);

    CLI::App app{"Market-clearing prices"};
    app.add_option("--ini", ini_path, "Defaults file");
    app.add_option("--input", in_path, "Input JSON path with valuation matrices");
    app.add_option("--output", out_path, "Output JSON report path");
    app.add_option("--vis-dir", vis_dir, "Preference graph image directory");
    app.add_option("--buyers", buyers, "Buyers in the random market, 0 for none")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--max-buyers", max_buyers, "Largest market the solver accepts")
        ->check(CLI::Range(1, 20));
    app.add_option("--max-valuation", max_valuation, "Largest random valuation")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--seed", seed, "Random seed, 0 for time based");
    CLI11_PARSE(app, argc, argv);

    try {
        if (buyers > max_buyers) {
            throw std::runtime_error("random market of " + std::to_string(buyers)
                                     + " buyers exceeds --max-buyers "
                                     + std::to_string(max_buyers));
        }
        std::vector<MarketCase> markets = in_path.empty() ? sample_markets()
                                                          : load_markets(in_path, max_buyers);

        cv::RNG rng(seed != 0 ? seed : static_cast<std::uint64_t>(cv::getTickCount()));
        std::vector<ClearingSolver> solvers;
        std::vector<std::string> names;
        if (buyers > 0) {
            solvers.emplace_back(ValuationModel(buyers, max_valuation, rng));
            names.push_back("random " + std::to_string(buyers) + "x" + std::to_string(buyers));
        }
        for (const auto& m : markets) {
            solvers.emplace_back(ValuationModel(m.valuations));
            names.push_back(m.name);
        }

        if (!vis_dir.empty()) std::filesystem::create_directories(vis_dir);

        nlohmann::ordered_json report = nlohmann::ordered_json::array();
        for (size_t i = 0; i < solvers.size(); ++i) {
            ClearingSolver& solver = solvers[i];
            std::vector<int> prices = solver.solve();
            bool valid = solver.is_valid_price_vector(prices);

            report_market(names[i], solver, valid);
            report.push_back(market_report(names[i], solver, valid));
            if (!vis_dir.empty()) draw_vis(vis_dir, static_cast<int>(i), solver);
        }

        if (!out_path.empty()) save_report(out_path, report);
        std::cout << "Clearing complete. Markets: " << solvers.size() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "market_clearing: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
