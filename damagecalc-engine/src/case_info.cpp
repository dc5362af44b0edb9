#include "case_info.hpp"

namespace damagecalc {

std::string case_type_to_string(CaseType type) {
    switch (type) {
        case CaseType::PersonalInjury: return "Personal Injury";
        case CaseType::WrongfulDeath: return "Wrongful Death";
        default: return "Personal Injury";
    }
}

CaseType case_type_from_string(const std::string& text) {
    if (text == "Wrongful Death" || text == "WrongfulDeath" || text == "wrongful_death") {
        return CaseType::WrongfulDeath;
    }
    return CaseType::PersonalInjury;
}

// ============================================================================
// CaseInfo Implementation
// ============================================================================

CaseInfo::CaseInfo()
    : state("New Jersey"),
      retirement_age(67.0),
      life_expectancy(0.0),
      wle_source("Skoog-Ciecka Work Life Expectancy Tables (2017)"),
      life_table_source("CDC National Vital Statistics Reports (2021)"),
      jurisdiction("New Jersey"),
      case_type(CaseType::PersonalInjury) {}

// ============================================================================
// EarningsParams Implementation
// ============================================================================

EarningsParams::EarningsParams()
    : base_earnings(0.0),
      residual_earnings(0.0),
      wle(0.0),
      wage_growth(3.50),
      discount_rate(4.25),
      enable_fringe_benefits(true),
      fringe_rate(21.5),
      pension(0.0),
      health_welfare(0.0),
      annuity(0.0),
      clothing_allowance(0.0),
      other_benefits(0.0),
      unemployment_rate(4.2),
      ui_replacement_rate(40.0),
      fed_tax_rate(15.0),
      state_tax_rate(4.5),
      enable_present_value(true),
      use_era_split(false),
      era_split_year(0),
      era1_wage_growth(3.50),
      era2_wage_growth(3.50),
      is_wrongful_death(false),
      era1_personal_consumption(0.0),
      era2_personal_consumption(0.0),
      enable_pji(false),
      pji_age(62.0),
      selected_scenario("age67") {}

double EarningsParams::flat_fringe_total() const {
    return pension + health_welfare + annuity + clothing_allowance + other_benefits;
}

double EarningsParams::past_wage_growth() const {
    return use_era_split ? era1_wage_growth : wage_growth;
}

double EarningsParams::future_wage_growth() const {
    return use_era_split ? era2_wage_growth : wage_growth;
}

// ============================================================================
// HhServices Implementation
// ============================================================================

HhServices::HhServices()
    : active(false),
      hours_per_week(0.0),
      hourly_rate(25.00),
      growth_rate(3.0),
      discount_rate(4.25) {}

} // namespace damagecalc
