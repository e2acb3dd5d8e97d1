#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <map>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <optional>
#include <initializer_list>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace stratlab {
namespace backtest {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Timestamp parseTimestampCell(const std::string& cell) {
    if (auto date = utils::TimeUtils::parseDate(cell)) {
        return *date;
    }
    size_t consumed = 0;
    const long long raw = std::stoll(cell, &consumed);
    if (consumed != cell.size()) {
        throw std::invalid_argument("bad timestamp '" + cell + "'");
    }
    return utils::TimeUtils::toMsTimestamp(raw);
}

Timestamp parseTimestampJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseTimestampCell(value.get<std::string>());
    }
    if (value.is_number()) {
        return utils::TimeUtils::toMsTimestamp(value.get<long long>());
    }
    throw std::invalid_argument("timestamp must be a string or number");
}

const nlohmann::json* firstOf(const nlohmann::json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (item.contains(key) && !item[key].is_null()) {
            return &item[key];
        }
    }
    return nullptr;
}

double requireNumber(const nlohmann::json& item, std::initializer_list<const char*> keys) {
    const nlohmann::json* value = firstOf(item, keys);
    if (!value) {
        throw std::invalid_argument(std::string("missing field '") + *keys.begin() + "'");
    }
    return value->get<double>();
}

} // namespace

DataHistory::DataHistory(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    // date, open, high, low, close, volume
    size_t col[6] = {0, 1, 2, 3, 4, 5};
    size_t skipped = 0;
    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header row: map named columns, anything else is malformed.
            std::map<std::string, size_t> named;
            for (size_t i = 0; i < row.size(); ++i) {
                named[toLower(row[i])] = i;
            }
            const char* names[6][2] = {
                {"date", "timestamp"}, {"open", "o"}, {"high", "h"},
                {"low", "l"}, {"close", "c"}, {"volume", "v"}
            };
            bool complete = true;
            size_t mapped[6] = {0, 0, 0, 0, 0, 0};
            for (size_t k = 0; k < 6; ++k) {
                auto it = named.find(names[k][0]);
                if (it == named.end()) it = named.find(names[k][1]);
                if (it == named.end()) {
                    complete = false;
                    break;
                }
                mapped[k] = it->second;
            }
            if (complete) {
                std::copy(std::begin(mapped), std::end(mapped), std::begin(col));
            }
            continue;
        }

        try {
            for (size_t k : col) {
                if (k >= row.size()) throw std::out_of_range("missing column");
            }
            Bar bar;
            bar.timestamp = parseTimestampCell(row[col[0]]);
            bar.open = std::stod(row[col[1]]);
            bar.high = std::stod(row[col[2]]);
            bar.low = std::stod(row[col[3]]);
            bar.close = std::stod(row[col[4]]);
            bar.volume = std::stod(row[col[5]]);
            bars.push_back(bar);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    normalize(bars);
    LOG_INFO("Loaded {} bars from {} ({} rows skipped)", bars.size(), file_path, skipped);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return bars;
    }

    if (!j.is_array()) {
        LOG_ERROR("JSON bar file must hold an array: {}", file_path);
        return bars;
    }

    for (const auto& item : j) {
        try {
            const nlohmann::json* ts = firstOf(item, {"date", "timestamp", "t"});
            if (!ts) {
                throw std::invalid_argument("missing field 'date'");
            }
            Bar bar;
            bar.timestamp = parseTimestampJson(*ts);
            bar.open = requireNumber(item, {"open", "o"});
            bar.high = requireNumber(item, {"high", "h"});
            bar.low = requireNumber(item, {"low", "l"});
            bar.close = requireNumber(item, {"close", "c"});
            bar.volume = requireNumber(item, {"volume", "v"});
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing bar: {} - {}", item.dump(), e.what());
        }
    }

    normalize(bars);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

void DataHistory::normalize(std::vector<Bar>& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().timestamp == bar.timestamp) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    bars.swap(unique);
}

std::vector<Bar> DataHistory::filterByDate(const std::vector<Bar>& bars,
                                           const std::string& start_date,
                                           const std::string& end_date) {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end_exclusive;

    if (!start_date.empty()) {
        start = utils::TimeUtils::parseDate(start_date);
        if (!start) LOG_WARN("Ignoring invalid start date: {}", start_date);
    }
    if (!end_date.empty()) {
        if (auto end = utils::TimeUtils::parseDate(end_date)) {
            end_exclusive = *end + MS_PER_DAY;
        } else {
            LOG_WARN("Ignoring invalid end date: {}", end_date);
        }
    }

    std::vector<Bar> out;
    for (const auto& bar : bars) {
        if (start && bar.timestamp < *start) continue;
        if (end_exclusive && bar.timestamp >= *end_exclusive) continue;
        out.push_back(bar);
    }
    return out;
}

std::vector<Bar> DataHistory::getHistoricalData(const std::string& ticker,
                                                const std::string& start_date,
                                                const std::string& end_date) {
    std::string upper = ticker;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& name : {ticker, upper}) {
        const auto csv = data_dir_ / (name + ".csv");
        if (std::filesystem::exists(csv)) {
            return filterByDate(loadCSV(csv.string()), start_date, end_date);
        }
        const auto json = data_dir_ / (name + ".json");
        if (std::filesystem::exists(json)) {
            return filterByDate(loadJSON(json.string()), start_date, end_date);
        }
    }

    LOG_WARN("No data file for {} in {}", ticker, data_dir_.string());
    return {};
}

} // namespace backtest
} // namespace stratlab
