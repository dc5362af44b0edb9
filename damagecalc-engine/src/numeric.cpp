#include "numeric.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace damagecalc {

std::optional<double> parse_number(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());

    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    if (start == end) {
        return std::nullopt;
    }

    // Thousands separators must sit between digits
    for (size_t i = start; i < end; ++i) {
        const char c = text[i];
        if (c == ',') {
            bool digit_before = i > start && std::isdigit(static_cast<unsigned char>(text[i - 1]));
            bool digit_after = i + 1 < end && std::isdigit(static_cast<unsigned char>(text[i + 1]));
            if (!digit_before || !digit_after) {
                return std::nullopt;
            }
            continue;
        }
        cleaned.push_back(c);
    }

    const char* begin = cleaned.c_str();
    char* parsed_end = nullptr;
    const double value = std::strtod(begin, &parsed_end);
    if (parsed_end == begin || *parsed_end != '\0') {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

double mid_year_discount(double rate_percent, int year_index, bool enabled) {
    if (!enabled) {
        return 1.0;
    }
    return 1.0 / std::pow(1.0 + rate_percent / 100.0, year_index + 0.5);
}

double growth_factor(double rate_percent, int year_index) {
    return std::pow(1.0 + rate_percent / 100.0, year_index);
}

} // namespace damagecalc
