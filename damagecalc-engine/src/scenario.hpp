#ifndef DAMAGECALC_SCENARIO_HPP
#define DAMAGECALC_SCENARIO_HPP

#include "case_info.hpp"
#include "date_calc.hpp"
#include "projection.hpp"
#include "household.hpp"
#include "life_care_plan.hpp"
#include <set>
#include <string>
#include <vector>

namespace damagecalc {

// Earnings loss under one alternative retirement age
struct ScenarioProjection {
    std::string id;                 // "wle", "age65", "age67", "age70", "pji"
    std::string label;              // e.g. "WLE (Age 34.9)", "Age 65"
    double retirement_age;
    double yfs;
    double wlf;                     // Fraction
    double wlf_percent;
    double total_past_loss;
    double total_future_pv;
    double total_earnings_loss;     // Past loss + future PV
    double grand_total;             // Earnings + household PV + LCP PV
    bool included;                  // Shown in reports

    ScenarioProjection();
};

// Fixed retirement ages compared in every report, ascending
const std::vector<double>& standard_retirement_ages();

// Inputs shared by every scenario
struct ScenarioInputs {
    const CaseInfo& case_info;
    const EarningsParams& params;
    const DateCalc& date_calc;
    const PastActuals& past_actuals;
    bool union_mode;
    const HhServices& household;
    const HhsData& household_data;
    const LcpData& lcp_data;
};

// Recompute the full algebraic method and projection for one retirement age
ScenarioProjection project_scenario(
    const ScenarioInputs& inputs,
    double age_at_injury,
    const std::string& id,
    const std::string& label,
    double retirement_age
);

// Build the scenario set, ordered: WLE-based first, then ages 65/67/70,
// then PJI when enabled. Returns an empty list when the birth or injury
// date is missing, age at injury is not positive, or WLE is zero.
// Scenario ids listed in `excluded` are returned with included = false.
std::vector<ScenarioProjection> compute_scenario_projections(
    const ScenarioInputs& inputs,
    const std::set<std::string>& excluded = {}
);

} // namespace damagecalc

#endif // DAMAGECALC_SCENARIO_HPP
