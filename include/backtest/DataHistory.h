#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/IMarketDataSource.h"

namespace stratlab {
namespace backtest {

// Local bar files: <data_dir>/<TICKER>.csv or <data_dir>/<TICKER>.json
class DataHistory : public IMarketDataSource {
public:
    explicit DataHistory(std::filesystem::path data_dir);

    std::vector<Bar> getHistoricalData(const std::string& ticker,
                                       const std::string& start_date,
                                       const std::string& end_date) override;

    const std::filesystem::path& dataDir() const { return data_dir_; }

    // Columns date|timestamp,open,high,low,close,volume. A header row, when
    // present, may reorder them. Dates are YYYY-MM-DD or epoch s/ms.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Array of {date|timestamp|t, open|o, high|h, low|l, close|c, volume|v}
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Inclusive on both ends; an end date keeps bars of that whole day.
    static std::vector<Bar> filterByDate(const std::vector<Bar>& bars,
                                         const std::string& start_date,
                                         const std::string& end_date);

    // Sorted by timestamp; for duplicate timestamps the last row wins.
    static void normalize(std::vector<Bar>& bars);

private:
    std::filesystem::path data_dir_;
};

} // namespace backtest
} // namespace stratlab
