#include "common/TimeUtils.h"

#include <cctype>
#include <cstdio>

namespace stratlab {
namespace utils {

namespace {
long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Howard Hinnant's days_from_civil / civil_from_days.
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}
}

Timestamp TimeUtils::fromCivil(int year, unsigned month, unsigned day) {
    return daysFromCivil(year, month, day) * MS_PER_DAY;
}

void TimeUtils::toCivil(Timestamp ts, int& year, unsigned& month, unsigned& day) {
    long long z = floorDiv(ts, MS_PER_DAY) + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<long long>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

std::optional<Timestamp> TimeUtils::parseDate(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (text.size() < pos + 10) {
        return std::nullopt;
    }

    const std::string date = text.substr(pos, 10);
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) {
            if (date[i] != '-') return std::nullopt;
        } else if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
            return std::nullopt;
        }
    }

    const int year = std::stoi(date.substr(0, 4));
    const unsigned month = static_cast<unsigned>(std::stoi(date.substr(5, 2)));
    const unsigned day = static_cast<unsigned>(std::stoi(date.substr(8, 2)));
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    return fromCivil(year, month, day);
}

std::string TimeUtils::formatDate(Timestamp ts) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    toCivil(ts, year, month, day);

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
    return buffer;
}

long long TimeUtils::daysBetween(Timestamp from, Timestamp to) {
    return floorDiv(to - from, MS_PER_DAY);
}

Timestamp TimeUtils::toMsTimestamp(long long ts) {
    // Anything below ~1973 in ms is taken as epoch seconds.
    if (ts > -100000000000LL && ts < 100000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

} // namespace utils
} // namespace stratlab
