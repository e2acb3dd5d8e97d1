#pragma once

#include "common/Types.h"

#include <optional>
#include <string>

namespace stratlab {
namespace utils {

class TimeUtils {
public:
    // "YYYY-MM-DD" (anything after the date, e.g. a time part, is ignored)
    static std::optional<Timestamp> parseDate(const std::string& text);

    static std::string formatDate(Timestamp ts);

    // Whole calendar days between two timestamps (floored).
    static long long daysBetween(Timestamp from, Timestamp to);

    // Epoch seconds are promoted to milliseconds.
    static Timestamp toMsTimestamp(long long ts);

    static Timestamp fromCivil(int year, unsigned month, unsigned day);
    static void toCivil(Timestamp ts, int& year, unsigned& month, unsigned& day);
};

} // namespace utils
} // namespace stratlab
