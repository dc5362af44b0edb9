#include "scenario.hpp"
#include "algebraic.hpp"
#include <algorithm>
#include <cmath>

namespace damagecalc {

namespace {

std::string format_age_label(double age) {
    if (age == std::floor(age)) {
        return std::to_string(static_cast<int>(age));
    }
    return format_years(age);
}

} // anonymous namespace

// ============================================================================
// ScenarioProjection Implementation
// ============================================================================

ScenarioProjection::ScenarioProjection()
    : retirement_age(0.0), yfs(0.0), wlf(0.0), wlf_percent(0.0),
      total_past_loss(0.0), total_future_pv(0.0), total_earnings_loss(0.0),
      grand_total(0.0), included(true) {}

const std::vector<double>& standard_retirement_ages() {
    static const std::vector<double> ages = {65.0, 67.0, 70.0};
    return ages;
}

ScenarioProjection project_scenario(
    const ScenarioInputs& inputs,
    double age_at_injury,
    const std::string& id,
    const std::string& label,
    double retirement_age)
{
    // Same chain as the headline calculation, with this scenario's YFS
    DateCalc scenario_dates = inputs.date_calc;
    scenario_dates.derived_yfs = std::max(0.0, retirement_age - age_at_injury);

    const Algebraic algebraic =
        compute_algebraic(inputs.params, scenario_dates, inputs.union_mode);
    const Projection projection = compute_projection(
        inputs.case_info, inputs.params, algebraic, inputs.past_actuals, scenario_dates);

    ScenarioProjection s;
    s.id = id;
    s.label = label;
    s.retirement_age = retirement_age;
    s.yfs = scenario_dates.derived_yfs;
    s.wlf = algebraic.wlf;
    s.wlf_percent = algebraic.wlf * 100.0;
    s.total_past_loss = projection.total_past_loss;
    s.total_future_pv = projection.total_future_pv;
    s.total_earnings_loss = s.total_past_loss + s.total_future_pv;
    s.grand_total = s.total_earnings_loss +
                    (inputs.household.active ? inputs.household_data.total_pv : 0.0) +
                    inputs.lcp_data.total_pv;
    return s;
}

std::vector<ScenarioProjection> compute_scenario_projections(
    const ScenarioInputs& inputs,
    const std::set<std::string>& excluded)
{
    std::vector<ScenarioProjection> scenarios;

    if (!parse_date(inputs.case_info.date_of_injury) ||
        !parse_date(inputs.case_info.date_of_birth)) {
        return scenarios;
    }
    const double age_at_injury = compute_age_at_injury(inputs.case_info);
    if (age_at_injury <= 0.0 || inputs.params.wle == 0.0) {
        return scenarios;
    }

    const double wle_retirement_age = age_at_injury + inputs.params.wle;
    if (wle_retirement_age > 0.0) {
        scenarios.push_back(project_scenario(
            inputs, age_at_injury, "wle",
            "WLE (Age " + format_years(wle_retirement_age) + ")", wle_retirement_age));
    }

    for (double age : standard_retirement_ages()) {
        const std::string age_text = format_age_label(age);
        scenarios.push_back(project_scenario(
            inputs, age_at_injury, "age" + age_text, "Age " + age_text, age));
    }

    if (inputs.params.enable_pji) {
        scenarios.push_back(project_scenario(
            inputs, age_at_injury, "pji",
            "PJI (Age " + format_age_label(inputs.params.pji_age) + ")",
            inputs.params.pji_age));
    }

    for (auto& s : scenarios) {
        s.included = excluded.find(s.id) == excluded.end();
    }

    return scenarios;
}

} // namespace damagecalc
