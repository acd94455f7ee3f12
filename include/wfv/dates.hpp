#pragma once

/// @file include/wfv/dates.hpp
/// @brief ISO-8601 date and timestamp helpers.
///
/// Dates are `YYYY-MM-DD`; timestamps are extended ISO strings
/// (`YYYY-MM-DDTHH:MM:SS`).  Parsing never throws.

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <optional>
#include <string>

namespace wfv::dates {

using Date      = boost::gregorian::date;
using Timestamp = boost::posix_time::ptime;

/// Parse `YYYY-MM-DD`.  Returns `nullopt` on malformed input.
[[nodiscard]] std::optional<Date> parse_date(const std::string& text) noexcept;

/// Format as `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(const Date& d);

/// Parse an extended ISO timestamp (`YYYY-MM-DDTHH:MM:SS[.fff]`).
[[nodiscard]] std::optional<Timestamp>
parse_timestamp(const std::string& text) noexcept;

/// Format as `YYYY-MM-DDTHH:MM:SS`.
[[nodiscard]] std::string format_timestamp(const Timestamp& t);

/// Compact sortable form `YYYYMMDDTHHMMSS`, used in identifiers.
[[nodiscard]] std::string compact_timestamp(const Timestamp& t);

/// Current UTC time, truncated to whole seconds.
[[nodiscard]] Timestamp now_utc();

}  // namespace wfv::dates
