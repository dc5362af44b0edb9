#ifndef DAMAGECALC_NUMERIC_HPP
#define DAMAGECALC_NUMERIC_HPP

#include <optional>
#include <string>

namespace damagecalc {

// Parse a user-entered amount such as "15000", " -2.5 ", "1,250.75" or "1e3".
// Returns std::nullopt for empty or non-numeric text and for NaN/Inf.
std::optional<double> parse_number(const std::string& text);

// Zero-fallback policy for optional numeric inputs
inline double number_or_zero(const std::optional<double>& value) {
    return value.value_or(0.0);
}

// Mid-year discount factor 1 / (1 + r)^(index + 0.5), rate in percent.
// Returns 1 when discounting is disabled.
double mid_year_discount(double rate_percent, int year_index, bool enabled = true);

// Compound growth (1 + g)^index, rate in percent
double growth_factor(double rate_percent, int year_index);

} // namespace damagecalc

#endif // DAMAGECALC_NUMERIC_HPP
