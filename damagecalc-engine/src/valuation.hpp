#ifndef DAMAGECALC_VALUATION_HPP
#define DAMAGECALC_VALUATION_HPP

#include "case_info.hpp"
#include "date_calc.hpp"
#include "algebraic.hpp"
#include "projection.hpp"
#include "household.hpp"
#include "life_care_plan.hpp"
#include "cpi_table.hpp"
#include "scenario.hpp"
#include "schedule.hpp"
#include <set>
#include <string>
#include <vector>

namespace damagecalc {

constexpr const char* CALCULATION_METHOD = "tinari-algebraic";
constexpr int REPORT_SCHEMA_VERSION = 1;

// grand total = past loss + future PV + household PV (when active) + LCP PV
double compute_grand_total(
    const Projection& projection,
    const HhServices& household,
    const HhsData& household_data,
    const LcpData& lcp_data
);

// Headline figures for quick reference
struct SummaryMetrics {
    double total_past_loss;
    double total_future_pv;
    double total_earnings_loss;     // Past loss + future PV
    double household_pv;            // 0 when household services are inactive
    double lcp_pv;
    double grand_total;

    SummaryMetrics();
};

SummaryMetrics compute_summary_metrics(
    const Projection& projection,
    const HhServices& household,
    const HhsData& household_data,
    const LcpData& lcp_data
);

// Everything the caller supplies about one case
struct ValuationInputs {
    CaseInfo case_info;
    EarningsParams earnings;
    HhServices household;
    std::vector<LcpItem> lcp_items;
    PastActuals past_actuals;
    bool union_mode;
    std::set<std::string> excluded_scenarios;

    ValuationInputs();
};

// Configuration options for valuation
struct ValuationConfig {
    CalendarDate valuation_date;    // "Today", for the current age
    int base_calendar_year;         // First detailed schedule year; 0 = derive
    CpiCategoryTable cpi_table;     // LCP category inflation rates

    explicit ValuationConfig(const CalendarDate& valuation_date);
};

struct ReportMetadata {
    std::string calculation_method;
    int schema_version;
    std::string valuation_date;     // YYYY-MM-DD
    int base_calendar_year;
    std::string case_type;
    std::string cpi_table_version;
    std::string active_scenario;    // Selected scenario id
    std::vector<std::string> included_scenarios;

    ReportMetadata();
};

// Complete damages calculation for one case
struct DamagesReport {
    ReportMetadata metadata;
    DateCalc date_calc;
    double work_life_factor;        // Percent
    Algebraic algebraic;
    Projection projection;
    HhsData household_data;
    LcpData lcp_data;
    std::vector<ScenarioProjection> scenarios;
    std::vector<PeriodRow> period_rows;
    SummaryMetrics summary;
    double grand_total;

    DamagesReport();

    // Scenario by id, nullptr if absent
    const ScenarioProjection* find_scenario(const std::string& id) const;
};

// Base year for detailed schedules: the configured year, else the trial
// year, else the valuation year
int resolve_base_calendar_year(const CaseInfo& case_info, const ValuationConfig& config);

std::string format_iso_date(const CalendarDate& date);

// Run the complete damages calculation:
//   1. Derive ages and spans as of the valuation date
//   2. Algebraic adjustment chain and earnings projection
//   3. Household services and life care plan valuation
//   4. Retirement age scenarios
//   5. Grand total, summary metrics and period rows
DamagesReport run_valuation(
    const ValuationInputs& inputs,
    const ValuationConfig& config
);

// Inputs the engine accepts but silently degrades: manual actuals that do
// not parse and LCP categories missing from the CPI table
std::vector<std::string> collect_input_warnings(
    const ValuationInputs& inputs,
    const CpiCategoryTable& table
);

} // namespace damagecalc

#endif // DAMAGECALC_VALUATION_HPP
