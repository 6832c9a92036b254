#include "timefmt.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

#include "common.hpp"

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t k = start; k < s.size(); ++k)
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
    return true;
}

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return (m == 2 && leap) ? 29 : days[m - 1];
}

}  // namespace

Timestamp parse_timestamp(const std::string& text) {
    if (all_digits(text)) {
        try {
            return std::stoll(text);
        } catch (const std::out_of_range&) {
            throw ValidationError("Timestamp out of range: '" + text + "'");
        }
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    char sep = 0;
    int used = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &used);
    ensure<ValidationError>(n == 3, "Unparseable timestamp: '" + text + "'");
    std::string rest = text.substr(static_cast<size_t>(used));
    if (!rest.empty()) {
        int used2 = 0;
        n = std::sscanf(rest.c_str(), "%c%2d:%2d%n", &sep, &h, &mi, &used2);
        ensure<ValidationError>(n == 3 && (sep == 'T' || sep == ' '), "Unparseable timestamp: '" + text + "'");
        rest = rest.substr(static_cast<size_t>(used2));
        if (!rest.empty() && rest[0] == ':') {
            int used3 = 0;
            n = std::sscanf(rest.c_str(), ":%2d%n", &s, &used3);
            ensure<ValidationError>(n == 1, "Unparseable timestamp: '" + text + "'");
            rest = rest.substr(static_cast<size_t>(used3));
        }
        ensure<ValidationError>(rest.empty() || rest == "Z", "Unparseable timestamp: '" + text + "'");
    }
    ensure<ValidationError>(mo >= 1 && mo <= 12 && d >= 1 && d <= days_in_month(y, mo) && h >= 0 && h < 24
                                && mi >= 0 && mi < 60 && s >= 0 && s < 61,
                            "Timestamp out of range: '" + text + "'");
    return days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d)) * SECONDS_PER_DAY
           + h * 3600 + mi * 60 + s;
}

std::string format_timestamp(Timestamp t, const std::string& fmt) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[128];
    size_t len = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
    return std::string(buf, len);
}
