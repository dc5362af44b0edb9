#include "schedule.hpp"
#include "algebraic.hpp"
#include "household.hpp"
#include "numeric.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace damagecalc {

// ============================================================================
// Earnings Schedule
// ============================================================================

std::vector<DetailedScheduleRow> compute_detailed_scenario_schedule(
    const CaseInfo& case_info,
    const EarningsParams& params,
    const DateCalc& date_calc,
    double retirement_age,
    bool union_mode,
    int base_calendar_year)
{
    std::vector<DetailedScheduleRow> schedule;

    if (!parse_date(case_info.date_of_injury) || !parse_date(case_info.date_of_birth)) {
        return schedule;
    }
    const double age_at_injury = compute_age_at_injury(case_info);
    if (age_at_injury <= 0.0) {
        return schedule;
    }

    DateCalc scenario_dates = date_calc;
    scenario_dates.derived_yfs = std::max(0.0, retirement_age - age_at_injury);

    const Algebraic algebraic = compute_algebraic(params, scenario_dates, union_mode);
    const Projection projection =
        compute_projection(case_info, params, algebraic, PastActuals(), scenario_dates);

    schedule.reserve(projection.future_schedule.size());
    double cum_pv = 0.0;
    for (const auto& row : projection.future_schedule) {
        cum_pv += row.pv;
        schedule.push_back(DetailedScheduleRow{
            row.year,
            base_calendar_year + row.year - 1,
            row.gross,
            row.net_loss,
            row.pv,
            cum_pv,
            false
        });
    }

    return schedule;
}

// ============================================================================
// Life Care Plan Schedule
// ============================================================================

DetailedLcpScheduleRow::DetailedLcpScheduleRow()
    : year_num(0), calendar_year(0), total_inflated(0.0), total_pv(0.0), cum_pv(0.0) {}

std::vector<DetailedLcpScheduleRow> compute_detailed_lcp_schedule(
    const std::vector<LcpItem>& items,
    double discount_rate,
    const CpiCategoryTable& table,
    int base_calendar_year,
    bool enable_present_value)
{
    std::map<int, DetailedLcpScheduleRow> by_year;

    for (const auto& item : items) {
        const double cpi = resolve_item_cpi(item, table);
        for (int year : resolve_active_years(item)) {
            const int t = year - 1;
            const double inflated = item.base_cost * growth_factor(cpi, t);
            const double pv = inflated * mid_year_discount(discount_rate, t, enable_present_value);

            auto& row = by_year[year];
            row.year_num = year;
            row.calendar_year = base_calendar_year + t;
            row.items.push_back(LcpScheduleEntry{item.name, item.base_cost, inflated, pv});
            row.total_inflated += inflated;
            row.total_pv += pv;
        }
    }

    std::vector<DetailedLcpScheduleRow> schedule;
    schedule.reserve(by_year.size());
    double cum_pv = 0.0;
    for (auto& entry : by_year) {
        cum_pv += entry.second.total_pv;
        entry.second.cum_pv = cum_pv;
        schedule.push_back(std::move(entry.second));
    }

    return schedule;
}

// ============================================================================
// Household Services Schedule
// ============================================================================

std::vector<DetailedHhsScheduleRow> compute_detailed_hhs_schedule(
    const HhServices& services,
    double derived_yfs,
    int base_calendar_year,
    bool enable_present_value)
{
    std::vector<DetailedHhsScheduleRow> schedule;
    if (!services.active) {
        return schedule;
    }

    const int years = static_cast<int>(std::ceil(derived_yfs));
    double cum_pv = 0.0;
    for (int i = 0; i < years; ++i) {
        const double annual_value = household_annual_value(services, i);
        const double pv =
            annual_value * mid_year_discount(services.discount_rate, i, enable_present_value);
        cum_pv += pv;
        schedule.push_back(DetailedHhsScheduleRow{
            i + 1, base_calendar_year + i, annual_value, pv, cum_pv
        });
    }

    return schedule;
}

// ============================================================================
// Period Rows
// ============================================================================

std::string period_type_to_string(PeriodType type) {
    switch (type) {
        case PeriodType::Past: return "past";
        case PeriodType::Future: return "future";
    }
    return "unknown";
}

std::vector<PeriodRow> compute_period_rows(const Projection& projection) {
    std::vector<PeriodRow> rows;
    rows.reserve(projection.past_schedule.size() + projection.future_schedule.size());

    double cumulative_pv = 0.0;
    int past_index = 0;
    for (const auto& past : projection.past_schedule) {
        cumulative_pv += past.net_loss;
        rows.push_back(PeriodRow{
            ++past_index,
            past.year,
            PeriodType::Past,
            past.gross_base,
            past.net_loss,
            1.0,
            past.net_loss,
            cumulative_pv
        });
    }

    for (const auto& future : projection.future_schedule) {
        cumulative_pv += future.pv;
        rows.push_back(PeriodRow{
            future.year,
            future.calendar_year,
            PeriodType::Future,
            future.gross,
            future.net_loss,
            future.discount_factor,
            future.pv,
            cumulative_pv
        });
    }

    return rows;
}

} // namespace damagecalc
