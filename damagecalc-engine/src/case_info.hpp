#ifndef DAMAGECALC_CASE_INFO_HPP
#define DAMAGECALC_CASE_INFO_HPP

#include <cstdint>
#include <string>

namespace damagecalc {

enum class CaseType : uint8_t {
    PersonalInjury = 0,
    WrongfulDeath = 1
};

std::string case_type_to_string(CaseType type);
CaseType case_type_from_string(const std::string& text);

// Plaintiff and case metadata. Dates are kept as entered (M/D/YYYY or
// YYYY-MM-DD) and parsed by the date calculator.
struct CaseInfo {
    std::string plaintiff;
    std::string file_number;
    std::string attorney;
    std::string law_firm;
    std::string report_date;
    std::string gender;
    std::string date_of_birth;
    std::string education;
    std::string marital_status;
    std::string dependents;
    std::string city;
    std::string county;
    std::string state;
    std::string date_of_injury;
    std::string date_of_trial;
    double retirement_age;          // Assumed retirement age for YFS
    double life_expectancy;         // Remaining years of life
    std::string wle_source;
    std::string life_table_source;
    std::string jurisdiction;
    CaseType case_type;

    // Narrative fields carried through to reports untouched
    std::string medical_summary;
    std::string employment_history;
    std::string earnings_history;
    std::string pre_injury_capacity;
    std::string post_injury_capacity;
    std::string functional_limitations;

    CaseInfo();
};

// Earnings and economic assumptions. Every rate is a percentage
// (3.5 means 3.5%), matching how the figures are entered.
struct EarningsParams {
    double base_earnings;           // Pre-injury annual earnings
    double residual_earnings;       // Post-injury earning capacity
    double wle;                     // Work-life expectancy in years
    double wage_growth;
    double discount_rate;

    // Fringe benefits: percentage in standard mode, flat dollars in union mode
    bool enable_fringe_benefits;
    double fringe_rate;
    double pension;
    double health_welfare;
    double annuity;
    double clothing_allowance;
    double other_benefits;

    double unemployment_rate;
    double ui_replacement_rate;
    double fed_tax_rate;
    double state_tax_rate;

    bool enable_present_value;

    // Era split: past losses grow at era 1 rates, future losses at era 2
    bool use_era_split;
    int era_split_year;
    double era1_wage_growth;
    double era2_wage_growth;

    // Wrongful death personal consumption, per era
    bool is_wrongful_death;
    double era1_personal_consumption;
    double era2_personal_consumption;

    // Permanent job incapacity scenario
    bool enable_pji;
    double pji_age;

    std::string selected_scenario;

    EarningsParams();

    // Sum of the itemized union-mode fringe amounts
    double flat_fringe_total() const;

    // Wage growth used for past (era 1) or future (era 2) years
    double past_wage_growth() const;
    double future_wage_growth() const;
};

// Household services capacity lost
struct HhServices {
    bool active;
    double hours_per_week;
    double hourly_rate;
    double growth_rate;
    double discount_rate;

    HhServices();
};

} // namespace damagecalc

#endif // DAMAGECALC_CASE_INFO_HPP
