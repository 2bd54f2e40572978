#include "retention/duration.hpp"

#include <cstdint>
#include <limits>

namespace keepsake {

namespace {

constexpr std::uint64_t kMaxNanoseconds =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

struct UnitScale {
    const char *suffix;
    std::uint64_t nanoseconds;
};

constexpr UnitScale kScales[] = {
    {"ns", 1ULL},
    {"us", 1000ULL},
    {"\xC2\xB5s", 1000ULL}, // U+00B5 micro sign
    {"\xCE\xBCs", 1000ULL}, // U+03BC greek small letter mu
    {"ms", 1000ULL * 1000},
    {"s", 1000ULL * 1000 * 1000},
    {"m", 60ULL * 1000 * 1000 * 1000},
    {"h", 3600ULL * 1000 * 1000 * 1000},
};

bool isDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

std::optional<std::uint64_t> scaleFor(const std::string &suffix)
{
    for (const auto &scale : kScales) {
        if (suffix == scale.suffix) {
            return scale.nanoseconds;
        }
    }
    return std::nullopt;
}

std::string stripSuffix(const std::string &value, const std::string &suffix,
                        const std::string &replacement)
{
    if (value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return value.substr(0, value.size() - suffix.size()) + replacement;
    }
    return value;
}

} // namespace

std::optional<std::chrono::nanoseconds> parseDuration(const std::string &text)
{
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (text.substr(pos) == "0") {
        return std::chrono::nanoseconds{0};
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    std::uint64_t total = 0;
    while (pos < text.size()) {
        // Integer part.
        std::uint64_t whole = 0;
        bool wholeOverflow = false;
        const std::size_t wholeStart = pos;
        while (pos < text.size() && isDigit(text[pos])) {
            const std::uint64_t digit = static_cast<std::uint64_t>(text[pos] - '0');
            if (whole > (kMaxNanoseconds - digit) / 10) {
                wholeOverflow = true;
            } else {
                whole = whole * 10 + digit;
            }
            ++pos;
        }
        bool hasDigits = pos > wholeStart;

        // Fractional part, kept as numerator / denominator.
        std::uint64_t fraction = 0;
        std::uint64_t denominator = 1;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const std::size_t fractionStart = pos;
            while (pos < text.size() && isDigit(text[pos])) {
                // Digits beyond 18 places cannot change the nanosecond result.
                if (denominator < 1000000000000000000ULL) {
                    fraction = fraction * 10 + static_cast<std::uint64_t>(text[pos] - '0');
                    denominator *= 10;
                }
                ++pos;
            }
            hasDigits = hasDigits || pos > fractionStart;
        }
        if (!hasDigits || wholeOverflow) {
            return std::nullopt;
        }

        const std::size_t suffixStart = pos;
        while (pos < text.size() && !isDigit(text[pos]) && text[pos] != '.') {
            ++pos;
        }
        const auto scale = scaleFor(text.substr(suffixStart, pos - suffixStart));
        if (!scale.has_value()) {
            return std::nullopt;
        }

        if (whole > kMaxNanoseconds / *scale) {
            return std::nullopt;
        }
        std::uint64_t value = whole * *scale;
        if (fraction > 0) {
            const long double part = static_cast<long double>(fraction)
                * static_cast<long double>(*scale)
                / static_cast<long double>(denominator);
            value += static_cast<std::uint64_t>(part);
        }
        if (value > kMaxNanoseconds || total > kMaxNanoseconds - value) {
            return std::nullopt;
        }
        total += value;
    }

    const auto signedTotal = static_cast<std::int64_t>(total);
    return std::chrono::nanoseconds{negative ? -signedTotal : signedTotal};
}

std::string formatDuration(long long seconds)
{
    std::string out;
    if (seconds < 0) {
        out = "-";
        seconds = -seconds;
    }
    const long long hours = seconds / 3600;
    const long long minutes = (seconds % 3600) / 60;
    const long long rest = seconds % 60;

    if (hours > 0) {
        out += std::to_string(hours) + "h" + std::to_string(minutes) + "m"
            + std::to_string(rest) + "s";
    } else if (minutes > 0) {
        out += std::to_string(minutes) + "m" + std::to_string(rest) + "s";
    } else {
        out += std::to_string(rest) + "s";
    }

    out = stripSuffix(out, "m0s", "m");
    out = stripSuffix(out, "h0m", "h");
    return out;
}

} // namespace keepsake
