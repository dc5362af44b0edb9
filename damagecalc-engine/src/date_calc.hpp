#ifndef DAMAGECALC_DATE_CALC_HPP
#define DAMAGECALC_DATE_CALC_HPP

#include "case_info.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace damagecalc {

// Average year length used for every age and span calculation
constexpr double DAYS_PER_YEAR = 365.25;

// Proleptic Gregorian calendar date
struct CalendarDate {
    int year;
    int month;                      // 1-12
    int day;                        // 1-31

    // Days since 1970-01-01 (negative before the epoch)
    int64_t days_since_epoch() const;

    bool operator==(const CalendarDate& other) const;
};

// Parse "M/D/YYYY" or "YYYY-MM-DD" (an ISO time suffix is ignored).
// Returns std::nullopt for empty, malformed or impossible dates.
std::optional<CalendarDate> parse_date(const std::string& text);

// Fractional years between two dates (negative when `to` precedes `from`)
double years_between(const CalendarDate& from, const CalendarDate& to);

// Format an age or span with one decimal place, e.g. "30.0"
std::string format_years(double years);

// Derived ages and spans for a case
struct DateCalc {
    std::string age_injury;         // Age at injury, one decimal
    std::string age_trial;          // Age at trial, one decimal
    std::string current_age;        // Age at the valuation date, one decimal
    double past_years;              // Injury to trial, >= 0
    double derived_yfs;             // Injury to retirement age, >= 0

    DateCalc();
};

// Compute ages and spans. If any of birth, injury or trial date is
// missing or unparseable the result is all zeros.
// `today` is the valuation date used for the current age.
DateCalc compute_date_calc(const CaseInfo& case_info, const CalendarDate& today);

// Age at injury at full precision; 0 when either date is unavailable
double compute_age_at_injury(const CaseInfo& case_info);

} // namespace damagecalc

#endif // DAMAGECALC_DATE_CALC_HPP
