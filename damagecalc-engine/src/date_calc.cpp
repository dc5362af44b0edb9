#include "date_calc.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace damagecalc {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

// Reads a run of 1..max_digits digits starting at pos. Advances pos.
bool read_number(const std::string& s, size_t& pos, size_t min_digits, size_t max_digits, int& out) {
    size_t start = pos;
    int value = 0;
    while (pos < s.size() && pos - start < max_digits &&
           std::isdigit(static_cast<unsigned char>(s[pos]))) {
        value = value * 10 + (s[pos] - '0');
        ++pos;
    }
    if (pos - start < min_digits) {
        return false;
    }
    out = value;
    return true;
}

std::optional<CalendarDate> make_date(int year, int month, int day) {
    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    if (day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    return CalendarDate{year, month, day};
}

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

} // anonymous namespace

// ============================================================================
// CalendarDate Implementation
// ============================================================================

int64_t CalendarDate::days_since_epoch() const {
    // Howard Hinnant's days_from_civil
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

std::optional<CalendarDate> parse_date(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    int a = 0;
    int b = 0;
    int c = 0;

    if (text.find('/') != std::string::npos) {
        // M/D/YYYY
        if (!read_number(text, pos, 1, 2, a) || pos >= text.size() || text[pos] != '/') {
            return std::nullopt;
        }
        ++pos;
        if (!read_number(text, pos, 1, 2, b) || pos >= text.size() || text[pos] != '/') {
            return std::nullopt;
        }
        ++pos;
        if (!read_number(text, pos, 4, 4, c) || pos != text.size()) {
            return std::nullopt;
        }
        return make_date(c, a, b);
    }

    // YYYY-MM-DD with an optional time component
    if (!read_number(text, pos, 4, 4, a) || pos >= text.size() || text[pos] != '-') {
        return std::nullopt;
    }
    ++pos;
    if (!read_number(text, pos, 2, 2, b) || pos >= text.size() || text[pos] != '-') {
        return std::nullopt;
    }
    ++pos;
    if (!read_number(text, pos, 2, 2, c)) {
        return std::nullopt;
    }
    if (pos != text.size() && text[pos] != 'T' && text[pos] != ' ') {
        return std::nullopt;
    }
    return make_date(a, b, c);
}

double years_between(const CalendarDate& from, const CalendarDate& to) {
    const int64_t days = to.days_since_epoch() - from.days_since_epoch();
    return static_cast<double>(days) / DAYS_PER_YEAR;
}

std::string format_years(double years) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << years;
    return oss.str();
}

// ============================================================================
// DateCalc Implementation
// ============================================================================

DateCalc::DateCalc()
    : age_injury("0"), age_trial("0"), current_age("0"),
      past_years(0.0), derived_yfs(0.0) {}

DateCalc compute_date_calc(const CaseInfo& case_info, const CalendarDate& today) {
    const auto dob = parse_date(case_info.date_of_birth);
    const auto doi = parse_date(case_info.date_of_injury);
    const auto dot = parse_date(case_info.date_of_trial);
    if (!dob || !doi || !dot) {
        return DateCalc();
    }

    const double age_at_injury = years_between(*dob, *doi);

    DateCalc result;
    result.age_injury = format_years(age_at_injury);
    result.age_trial = format_years(years_between(*dob, *dot));
    result.current_age = format_years(years_between(*dob, today));
    result.past_years = std::max(0.0, years_between(*doi, *dot));
    // Chronological, not probability weighted
    result.derived_yfs = std::max(0.0, case_info.retirement_age - age_at_injury);
    return result;
}

double compute_age_at_injury(const CaseInfo& case_info) {
    const auto dob = parse_date(case_info.date_of_birth);
    const auto doi = parse_date(case_info.date_of_injury);
    if (!dob || !doi) {
        return 0.0;
    }
    return years_between(*dob, *doi);
}

} // namespace damagecalc
