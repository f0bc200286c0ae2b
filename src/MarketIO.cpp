#include "MarketIO.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fstream>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace std;

// -----------------------------------------------------------------------------
// Read defaults from .ini config
string get_ini_value(const string& section, const string& key, const string& path)
{
    ifstream file(path);
    if (!file.is_open()) return "";

    string line, current_section;
    regex section_re(R"(\[(.*?)\])");
    regex keyval_re(R"(^\s*([^=]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");
    smatch match;

    while (getline(file, line)) {
        if (regex_match(line, match, section_re)) {
            current_section = match[1];
        } else if (current_section == section && regex_match(line, match, keyval_re)) {
            if (match[1] == key) {
                return match[2];
            }
        }
    }
    return "";
}

// -----------------------------------------------------------------------------

static int parse_valuation(const nlohmann::json& v, const string& name, int i, int j)
{
    ostringstream where;
    where << "Invalid market \"" << name << "\": valuation " << v.dump()
          << " at (" << i << ", " << j << ")";

    if (!v.is_number_integer())
        throw runtime_error(where.str() + " is not an integer");
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() > static_cast<unsigned long long>(numeric_limits<int>::max()))
            throw runtime_error(where.str() + " exceeds " + to_string(numeric_limits<int>::max()));
        return static_cast<int>(v.get<unsigned long long>());
    }
    long long x = v.get<long long>();
    if (x < 0) throw runtime_error(where.str() + " is negative");
    if (x > numeric_limits<int>::max())
        throw runtime_error(where.str() + " exceeds " + to_string(numeric_limits<int>::max()));
    return static_cast<int>(x);
}

static MarketCase parse_market(const nlohmann::json& m, size_t idx, int max_buyers)
{
    if (!m.is_object())
        throw runtime_error("Market " + to_string(idx) + " is not a JSON object");

    MarketCase mc;
    mc.name = m.value("name", "market " + to_string(idx));

    auto rows = m.find("valuations");
    if (rows == m.end() || !rows->is_array())
        throw runtime_error("Invalid market \"" + mc.name + "\": valuations must be an array of rows");

    int n = static_cast<int>(rows->size());
    if (n == 0) throw runtime_error("Invalid market \"" + mc.name + "\": no valuations");
    if (n > max_buyers) {
        ostringstream msg;
        msg << "Invalid market \"" << mc.name << "\": " << n
            << " buyers, at most " << max_buyers << " are supported";
        throw runtime_error(msg.str());
    }

    mc.valuations.create(n, n);
    for (int i = 0; i < n; ++i) {
        const nlohmann::json& row = (*rows)[i];
        if (!row.is_array() || static_cast<int>(row.size()) != n) {
            ostringstream msg;
            msg << "Invalid market \"" << mc.name << "\": row " << i
                << " must hold " << n << " valuations";
            throw runtime_error(msg.str());
        }
        for (int j = 0; j < n; ++j) mc.valuations(i, j) = parse_valuation(row[j], mc.name, i, j);
    }
    return mc;
}

vector<MarketCase> parse_markets(const nlohmann::json& j, int max_buyers)
{
    vector<MarketCase> markets;
    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) markets.push_back(parse_market(j[i], i, max_buyers));
    } else if (j.is_object()) {
        markets.push_back(parse_market(j, 0, max_buyers));
    } else {
        throw runtime_error("Market file must hold an object or an array of objects");
    }
    return markets;
}

vector<MarketCase> load_markets(const string& path, int max_buyers)
{
    ifstream in(path);
    if (!in.is_open()) throw runtime_error("Cannot open market file " + path);

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw runtime_error("Cannot parse " + path + ": " + e.what());
    }
    return parse_markets(j, max_buyers);
}

vector<MarketCase> sample_markets()
{
    cv::Mat1i three = (cv::Mat1i(3, 3) <<
        6, 5, 2,
        7, 6, 3,
        6, 7, 6);

    // column 4 is worthless to everybody
    cv::Mat1i five = (cv::Mat1i(5, 5) <<
        5, 4, 2, 0, 0,
        3, 5, 4, 3, 0,
        6, 1, 2, 3, 0,
        1, 7, 8, 3, 0,
        1, 2, 0, 3, 0);

    return {{"sample 3x3", three}, {"sample 5x5", five}};
}

// -----------------------------------------------------------------------------

static nlohmann::ordered_json matrix_json(const cv::Mat1i& m)
{
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (int i = 0; i < m.rows; ++i) {
        nlohmann::ordered_json row = nlohmann::ordered_json::array();
        for (int j = 0; j < m.cols; ++j) row.push_back(m(i, j));
        rows.push_back(row);
    }
    return rows;
}

nlohmann::ordered_json market_report(const string& name, const ClearingSolver& solver, bool valid)
{
    nlohmann::ordered_json o;
    o["name"]       = name;
    o["valuations"] = matrix_json(solver.model().original());
    o["adjusted"]   = matrix_json(solver.model().adjusted());
    o["prices"]     = solver.price_vector();
    o["iterations"] = solver.iterations();
    o["valid"]      = valid;
    o["assignment"] = solver.find_assignment();
    return o;
}

void save_report(const string& path, const nlohmann::ordered_json& report)
{
    ofstream out(path);
    if (!out.is_open()) throw runtime_error("Cannot write report " + path);
    out << setw(2) << report;
}

// -----------------------------------------------------------------------------

void print_matrix(ostream& out, const string& title, const cv::Mat1i& m)
{
    out << title << ":\n";
    for (int i = 0; i < m.rows; ++i) {
        for (int j = 0; j < m.cols; ++j) out << setw(4) << m(i, j);
        out << "\n";
    }
    out << "\n";
}

void print_prices(ostream& out, const vector<int>& prices)
{
    out << "Price vector:";
    for (int p : prices) out << " " << p;
    out << "\n\n";
}

cv::Mat render_preference_graph(const ClearingSolver& solver, int W, int H)
{
    cv::Mat img(H, W, CV_8UC3, cv::Scalar(30, 30, 30));
    const int n = solver.model().size();
    const PreferenceGraph& graph = solver.preference_graph();
    const Assignment assignment = solver.find_assignment();

    auto row_y = [&](int k) { return int((k + 1) * double(H) / (n + 1)); };
    const int xb = W / 4, xp = 3 * W / 4;

    for (int i = 0; i < static_cast<int>(graph.size()); ++i) {
        for (int j : graph[i]) {
            bool matched = !assignment.empty() && assignment[i] == j;
            cv::line(img, {xb, row_y(i)}, {xp, row_y(j)},
                     matched ? cv::Scalar(0, 255, 0) : cv::Scalar(150, 150, 150),
                     matched ? 3 : 1, cv::LINE_AA);
        }
    }
    for (int k = 0; k < n; ++k) {
        cv::circle(img, {xb, row_y(k)}, 8, cv::Scalar(255, 200, 0), cv::FILLED);
        cv::circle(img, {xp, row_y(k)}, 8, cv::Scalar(0, 200, 255), cv::FILLED);
        cv::putText(img, "buyer " + to_string(k), {xb - 110, row_y(k) + 5},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
        cv::putText(img, "product " + to_string(k) + " @ " + to_string(solver.price_vector()[k]),
                    {xp + 15, row_y(k) + 5},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1);
    }
    return img;
}

void draw_vis(const string& dir, int idx, const ClearingSolver& solver)
{
    ostringstream fn; fn << dir << "/market_" << setw(4)
                         << setfill('0') << idx << ".png";
    if (!cv::imwrite(fn.str(), render_preference_graph(solver)))
        throw runtime_error("Cannot write " + fn.str());
}
