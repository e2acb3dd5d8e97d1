#include "backtest/DataHistory.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace stratlab;
using stratlab::backtest::DataHistory;
using stratlab::utils::TimeUtils;

namespace {
void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "stratlab_test_data";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    {
        // Reordered header, BOM, quotes, a bad row, out-of-order and duplicate dates
        writeFile(dir / "AAA.csv",
                  "\xEF\xBB\xBF" "date,close,open,high,low,volume\n"
                  "2024-01-03,12,11,13,10,300\n"
                  "\"2024-01-02\",11,10,12,9,200\n"
                  "2024-01-04,oops,1,1,1,1\n"
                  "2024-01-03,12.5,11,13,10,350\n"
                  "2024-01-05,13,12,14,11,400\n");

        const auto bars = DataHistory::loadCSV((dir / "AAA.csv").string());
        assert(bars.size() == 3);
        assert(TimeUtils::formatDate(bars[0].timestamp) == "2024-01-02");
        assert(bars[0].open == 10.0 && bars[0].close == 11.0);
        assert(bars[1].close == 12.5 && bars[1].volume == 350.0);
        assert(TimeUtils::formatDate(bars[2].timestamp) == "2024-01-05");
    }

    {
        // Headerless rows with epoch seconds
        writeFile(dir / "EPOCH.csv",
                  "1704153600,1,2,0.5,1.5,10\n"
                  "1704240000,1.5,2.5,1,2,20\n");
        const auto bars = DataHistory::loadCSV((dir / "EPOCH.csv").string());
        assert(bars.size() == 2);
        assert(TimeUtils::formatDate(bars[0].timestamp) == "2024-01-02");
        assert(bars[1].high == 2.5);
    }

    {
        writeFile(dir / "BBB.json",
                  R"([{"date": "2024-02-01", "o": 1, "h": 2, "l": 0.5, "c": 1.5, "v": 100},
                      {"timestamp": 1706832000000, "open": 1.5, "high": 2.5, "low": 1, "close": 2, "volume": 200},
                      {"date": "2024-02-03", "open": 2}])");
        const auto bars = DataHistory::loadJSON((dir / "BBB.json").string());
        assert(bars.size() == 2);
        assert(bars[0].close == 1.5);
        assert(TimeUtils::formatDate(bars[1].timestamp) == "2024-02-02");
    }

    {
        DataHistory history(dir);
        // Ticker lookup falls back to upper case; the end date is inclusive
        const auto bars = history.getHistoricalData("aaa", "2024-01-03", "2024-01-05");
        assert(bars.size() == 2);
        assert(TimeUtils::formatDate(bars.back().timestamp) == "2024-01-05");

        assert(history.getHistoricalData("AAA", "", "").size() == 3);
        assert(history.getHistoricalData("AAA", "2024-01-03", "").size() == 2);
        assert(history.getHistoricalData("AAA", "", "2024-01-02").size() == 1);
        assert(history.getHistoricalData("BBB", "", "").size() == 2);
        assert(history.getHistoricalData("MISSING", "", "").empty());
        assert(history.getHistoricalData("AAA", "2025-01-01", "").empty());
    }

    assert(DataHistory::loadCSV((dir / "nope.csv").string()).empty());

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
