#include "valuation.hpp"
#include "numeric.hpp"
#include <cstdio>

namespace damagecalc {

// ============================================================================
// Grand Total
// ============================================================================

double compute_grand_total(
    const Projection& projection,
    const HhServices& household,
    const HhsData& household_data,
    const LcpData& lcp_data)
{
    return projection.total_past_loss + projection.total_future_pv +
           (household.active ? household_data.total_pv : 0.0) + lcp_data.total_pv;
}

SummaryMetrics::SummaryMetrics()
    : total_past_loss(0.0), total_future_pv(0.0), total_earnings_loss(0.0),
      household_pv(0.0), lcp_pv(0.0), grand_total(0.0) {}

SummaryMetrics compute_summary_metrics(
    const Projection& projection,
    const HhServices& household,
    const HhsData& household_data,
    const LcpData& lcp_data)
{
    SummaryMetrics m;
    m.total_past_loss = projection.total_past_loss;
    m.total_future_pv = projection.total_future_pv;
    m.total_earnings_loss = m.total_past_loss + m.total_future_pv;
    m.household_pv = household.active ? household_data.total_pv : 0.0;
    m.lcp_pv = lcp_data.total_pv;
    m.grand_total = compute_grand_total(projection, household, household_data, lcp_data);
    return m;
}

// ============================================================================
// Inputs, Config and Report
// ============================================================================

ValuationInputs::ValuationInputs() : union_mode(false) {}

ValuationConfig::ValuationConfig(const CalendarDate& valuation_date)
    : valuation_date(valuation_date),
      base_calendar_year(0),
      cpi_table(CpiCategoryTable::default_table()) {}

ReportMetadata::ReportMetadata()
    : calculation_method(CALCULATION_METHOD),
      schema_version(REPORT_SCHEMA_VERSION),
      base_calendar_year(0) {}

DamagesReport::DamagesReport() : work_life_factor(0.0), grand_total(0.0) {}

const ScenarioProjection* DamagesReport::find_scenario(const std::string& id) const {
    for (const auto& s : scenarios) {
        if (s.id == id) {
            return &s;
        }
    }
    return nullptr;
}

int resolve_base_calendar_year(const CaseInfo& case_info, const ValuationConfig& config) {
    if (config.base_calendar_year > 0) {
        return config.base_calendar_year;
    }
    if (const auto trial = parse_date(case_info.date_of_trial)) {
        return trial->year;
    }
    return config.valuation_date.year;
}

std::string format_iso_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buffer;
}

// ============================================================================
// Valuation
// ============================================================================

DamagesReport run_valuation(const ValuationInputs& inputs, const ValuationConfig& config) {
    DamagesReport report;
    const EarningsParams& params = inputs.earnings;

    report.date_calc = compute_date_calc(inputs.case_info, config.valuation_date);
    report.work_life_factor = compute_work_life_factor(params, report.date_calc.derived_yfs);

    report.algebraic = compute_algebraic(params, report.date_calc, inputs.union_mode);
    report.projection = compute_projection(
        inputs.case_info, params, report.algebraic, inputs.past_actuals, report.date_calc);

    report.household_data = compute_household_services(
        inputs.household, report.date_calc.derived_yfs, params.enable_present_value);
    report.lcp_data = compute_life_care_plan(
        inputs.lcp_items, params.discount_rate, config.cpi_table, params.enable_present_value);

    const ScenarioInputs scenario_inputs{
        inputs.case_info,
        params,
        report.date_calc,
        inputs.past_actuals,
        inputs.union_mode,
        inputs.household,
        report.household_data,
        report.lcp_data
    };
    report.scenarios = compute_scenario_projections(scenario_inputs, inputs.excluded_scenarios);

    report.grand_total = compute_grand_total(
        report.projection, inputs.household, report.household_data, report.lcp_data);
    report.summary = compute_summary_metrics(
        report.projection, inputs.household, report.household_data, report.lcp_data);
    report.period_rows = compute_period_rows(report.projection);

    ReportMetadata& meta = report.metadata;
    meta.valuation_date = format_iso_date(config.valuation_date);
    meta.base_calendar_year = resolve_base_calendar_year(inputs.case_info, config);
    meta.case_type = case_type_to_string(inputs.case_info.case_type);
    meta.cpi_table_version = config.cpi_table.version();
    meta.active_scenario = params.selected_scenario;
    for (const auto& s : report.scenarios) {
        if (s.included) {
            meta.included_scenarios.push_back(s.id);
        }
    }

    return report;
}

std::vector<std::string> collect_input_warnings(
    const ValuationInputs& inputs,
    const CpiCategoryTable& table)
{
    std::vector<std::string> warnings;

    for (const auto& entry : inputs.past_actuals) {
        if (entry.second.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        if (!parse_number(entry.second)) {
            warnings.push_back("Manual actual earnings for " + std::to_string(entry.first) +
                               " is not a number (\"" + entry.second +
                               "\"); using residual earnings");
        }
    }

    for (const auto& item : inputs.lcp_items) {
        if (!item.cpi && !table.contains(item.category_id)) {
            warnings.push_back("Life care plan item '" + item.name +
                               "' has unknown CPI category '" + item.category_id +
                               "'; inflating at 0%");
        }
    }

    return warnings;
}

} // namespace damagecalc
