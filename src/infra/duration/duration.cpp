#include "duration.hpp"
#include <cctype>
#include <fmt/core.h>

namespace objcp::infra {

auto parse_duration(std::string_view text) -> Result<std::chrono::seconds> {
    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidDuration, "empty duration"));
    }

    std::chrono::seconds total{0};
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
            return std::unexpected(make_error(ErrorCode::InvalidDuration,
                fmt::format("invalid duration '{}': expected a number at position {}", text, pos)));
        }

        std::int64_t value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            value = value * 10 + (text[pos] - '0');
            if (value > 1'000'000'000) {
                return std::unexpected(make_error(ErrorCode::InvalidDuration,
                    fmt::format("invalid duration '{}': value too large", text)));
            }
            ++pos;
        }

        if (pos == text.size()) {
            return std::unexpected(make_error(ErrorCode::InvalidDuration,
                fmt::format("invalid duration '{}': missing unit", text)));
        }

        switch (std::tolower(static_cast<unsigned char>(text[pos]))) {
            case 'w': total += std::chrono::weeks(value); break;
            case 'd': total += std::chrono::days(value); break;
            case 'h': total += std::chrono::hours(value); break;
            case 'm': total += std::chrono::minutes(value); break;
            case 's': total += std::chrono::seconds(value); break;
            default:
                return std::unexpected(make_error(ErrorCode::InvalidDuration,
                    fmt::format("invalid duration '{}': unknown unit '{}'", text, text[pos])));
        }
        ++pos;
    }
    return total;
}

auto AgeFilter::create(std::string_view older_than, std::string_view newer_than)
    -> Result<AgeFilter>
{
    AgeFilter filter;
    if (!older_than.empty()) {
        auto parsed = parse_duration(older_than);
        if (!parsed) return std::unexpected(std::move(parsed.error()));
        filter.older_than_ = *parsed;
    }
    if (!newer_than.empty()) {
        auto parsed = parse_duration(newer_than);
        if (!parsed) return std::unexpected(std::move(parsed.error()));
        filter.newer_than_ = *parsed;
    }
    return filter;
}

auto AgeFilter::skip(std::chrono::system_clock::time_point mod_time,
                     std::chrono::system_clock::time_point now) const -> bool
{
    const auto age = now - mod_time;
    // --older-than X: оставляем только объекты старше X
    if (older_than_ && age < *older_than_) return true;
    // --newer-than X: оставляем только объекты моложе X
    if (newer_than_ && age >= *newer_than_) return true;
    return false;
}

} // namespace objcp::infra
