#ifndef DAMAGECALC_SCHEDULE_HPP
#define DAMAGECALC_SCHEDULE_HPP

#include "case_info.hpp"
#include "date_calc.hpp"
#include "projection.hpp"
#include "life_care_plan.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace damagecalc {

// Year-over-year earnings loss for one retirement age
struct DetailedScheduleRow {
    int year_num;                   // 1-based
    int calendar_year;
    double gross_earnings;
    double net_loss;
    double present_value;
    double cum_pv;                  // Running total of present_value
    bool is_past;
};

// Expanded future earnings schedule for an arbitrary retirement age.
// Rows come from the same algebraic and projection path as the headline
// figures with that age's YFS substituted; calendar_year = base + (year_num - 1).
// Empty when the birth or injury date is missing or age at injury <= 0.
std::vector<DetailedScheduleRow> compute_detailed_scenario_schedule(
    const CaseInfo& case_info,
    const EarningsParams& params,
    const DateCalc& date_calc,
    double retirement_age,
    bool union_mode,
    int base_calendar_year
);

// One item's cost within a plan year
struct LcpScheduleEntry {
    std::string name;
    double base_cost;
    double inflated_cost;
    double pv;
};

struct DetailedLcpScheduleRow {
    int year_num;                   // Absolute plan year, 1-based
    int calendar_year;
    std::vector<LcpScheduleEntry> items;
    double total_inflated;
    double total_pv;
    double cum_pv;

    DetailedLcpScheduleRow();
};

// Life care plan costs grouped by plan year, ascending, with running
// cumulative PV. Only years in which some item is active get a row.
std::vector<DetailedLcpScheduleRow> compute_detailed_lcp_schedule(
    const std::vector<LcpItem>& items,
    double discount_rate,
    const CpiCategoryTable& table,
    int base_calendar_year,
    bool enable_present_value = true
);

struct DetailedHhsScheduleRow {
    int year_num;
    int calendar_year;
    double annual_value;
    double present_value;
    double cum_pv;
};

// One row per year over ceil(derived_yfs) years; empty when inactive
std::vector<DetailedHhsScheduleRow> compute_detailed_hhs_schedule(
    const HhServices& services,
    double derived_yfs,
    int base_calendar_year,
    bool enable_present_value = true
);

enum class PeriodType : uint8_t {
    Past = 0,
    Future = 1
};

std::string period_type_to_string(PeriodType type);

// Past and future schedules merged into one reporting table
struct PeriodRow {
    int year_num;                   // 1-based within its period
    int calendar_year;
    PeriodType period_type;
    double gross_income;
    double net_loss;
    double discount_factor;         // 1 for past rows
    double present_value;           // net_loss for past rows
    double cumulative_pv;
};

// Merge a projection's past rows (undiscounted) and future rows. Each row
// keeps its own calendar year and the discount factor the projection applied.
std::vector<PeriodRow> compute_period_rows(const Projection& projection);

} // namespace damagecalc

#endif // DAMAGECALC_SCHEDULE_HPP
