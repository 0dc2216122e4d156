#include "csv_bar_reader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {
    std::string trim(const std::string& s) {
        const auto begin = s.find_first_not_of(" \t\r");
        if (begin == std::string::npos) return "";
        const auto end = s.find_last_not_of(" \t\r");
        return s.substr(begin, end - begin + 1);
    }
}

core::TimeSeries<core::Bar> parseBarsCsv(std::istream& input, int utc_offset_minutes) {
    core::TimeSeries<core::Bar> bars;
    std::string line;
    size_t line_no = 0;

    while (std::getline(input, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty()) continue;
        if (line_no == 1 && line.find("timestamp") != std::string::npos) continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;
        while (std::getline(ss, token, ',')) {
            tokens.push_back(trim(token));
        }
        if (tokens.size() != 6) {
            throw core::DataException(fmt::format("CSV line {}: expected 6 columns, got {}", line_no, tokens.size()));
        }

        core::Bar bar;
        try {
            bar.timestamp = tokens[0].size() == 10
                ? core::utils::dateToTimestamp(tokens[0], utc_offset_minutes)
                : core::utils::stringToTimestamp(tokens[0]);
            bar.open = std::stod(tokens[1]);
            bar.high = std::stod(tokens[2]);
            bar.low = std::stod(tokens[3]);
            bar.close = std::stod(tokens[4]);
            bar.volume = std::stoll(tokens[5]);
        } catch (const std::logic_error& e) {
            // std::stod / std::stoll: invalid_argument and out_of_range
            throw core::DataException(fmt::format("CSV line {}: bad number ({})", line_no, e.what()));
        } catch (const core::DataException& e) {
            throw core::DataException(fmt::format("CSV line {}: {}", line_no, e.what()));
        }
        bars.push_back(bar);
    }

    std::stable_sort(bars.begin(), bars.end());
    return bars;
}

core::TimeSeries<core::Bar> readBarsCsv(const std::string& path, int utc_offset_minutes) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::DataException("Cannot open file: " + path);
    }
    auto bars = parseBarsCsv(file, utc_offset_minutes);
    core::logging::getLogger()->info("Read {} bars from {}", bars.size(), path);
    return bars;
}

} // namespace data
