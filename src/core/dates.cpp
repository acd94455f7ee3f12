/// @file src/core/dates.cpp
/// @brief ISO-8601 helpers over Boost.Gregorian / Boost.PosixTime.

#include "wfv/dates.hpp"

#include <exception>

namespace wfv::dates {

namespace bg = boost::gregorian;
namespace bpt = boost::posix_time;

std::optional<Date> parse_date(const std::string& text) noexcept {
    // from_simple_string accepts several layouts; insist on YYYY-MM-DD.
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    try {
        Date d = bg::from_simple_string(text);
        if (d.is_special()) return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_date(const Date& d) {
    return bg::to_iso_extended_string(d);
}

std::optional<Timestamp> parse_timestamp(const std::string& text) noexcept {
    if (text.size() < 19 || text[10] != 'T') {
        return std::nullopt;
    }
    try {
        // time_from_string expects a space separator.
        std::string s = text;
        s[10] = ' ';
        Timestamp t = bpt::time_from_string(s);
        if (t.is_special()) return std::nullopt;
        return t;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_timestamp(const Timestamp& t) {
    // to_iso_extended_string appends fractional seconds only when non-zero.
    std::string s = bpt::to_iso_extended_string(t);
    const auto dot = s.find('.');
    if (dot != std::string::npos) s.erase(dot);
    return s;
}

std::string compact_timestamp(const Timestamp& t) {
    std::string s = bpt::to_iso_string(t);  // YYYYMMDDTHHMMSS[,fff]
    const auto frac = s.find_first_of(",.");
    if (frac != std::string::npos) s.erase(frac);
    return s;
}

Timestamp now_utc() {
    return bpt::second_clock::universal_time();
}

}  // namespace wfv::dates
