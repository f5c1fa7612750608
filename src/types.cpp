#include "types.h"

#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace claimscan {

namespace {

auto ParseDigits(const std::string& text, size_t pos, size_t len) -> int {
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid period: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // namespace

auto Period::Parse(const std::string& text) -> Period {
    if ((text.size() != 7 && text.size() != 10) || text[4] != '-') {
        throw std::invalid_argument("Invalid period: " + text);
    }
    if (text.size() == 10 && text[7] != '-') {
        throw std::invalid_argument("Invalid period: " + text);
    }

    Period p;
    p.year = ParseDigits(text, 0, 4);
    p.month = ParseDigits(text, 5, 2);
    if (p.month < 1 || p.month > 12) {
        throw std::invalid_argument("Invalid period month: " + text);
    }
    if (text.size() == 10) {
        int day = ParseDigits(text, 8, 2);
        if (day < 1 || day > 31) {
            throw std::invalid_argument("Invalid period day: " + text);
        }
    }
    return p;
}

auto Period::ToString() const -> std::string {
    return fmt::format("{:04d}-{:02d}", year, month);
}

} // namespace claimscan
