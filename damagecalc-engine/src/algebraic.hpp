#ifndef DAMAGECALC_ALGEBRAIC_HPP
#define DAMAGECALC_ALGEBRAIC_HPP

#include "case_info.hpp"
#include "date_calc.hpp"

namespace damagecalc {

// Breakdown of the Tinari algebraic method. Every value is a fraction of
// gross earnings (gross earnings = 1.0), so multiplying by base earnings
// gives the dollar amount at that step.
struct Algebraic {
    double yfs;                             // Years to final separation used
    double wlf;                             // Work-life factor WLE / YFS
    double unemployment_factor;             // Retention 1 - UR x (1 - UIR)
    double fringe_factor;                   // 1 + effective fringe rate
    double flat_fringe_amount;              // Union-mode dollar total, 0 otherwise
    double combined_tax_rate;               // 1 - (1 - fed)(1 - state)
    double after_tax_factor;                // 1 - combined_tax_rate

    // Cumulative steps, in order
    double worklife_adjusted_base;          // WLF
    double unemployment_adjusted_base;      // x unemployment factor
    double gross_compensation_with_fringes; // x fringe factor
    double tax_on_base_earnings;            // unemployment-adjusted base x tax
    double after_tax_compensation;          // gross with fringes - tax on base

    // Personal consumption (0 for personal injury) and era multipliers
    double era1_personal_consumption;
    double era2_personal_consumption;
    double era1_aif;                        // Past losses
    double era2_aif;                        // Future losses

    double full_multiplier;                 // Headline AIF
    double realized_multiplier;             // Nets manually entered actual earnings

    Algebraic();
};

// Combined federal + state tax as a fraction, rates in percent.
// Taxes compound: 1 - (1 - fed)(1 - state).
double combined_tax_rate(double fed_tax_percent, double state_tax_percent);

// Work-life factor as a percentage (87.4 means 87.4%); 0 when YFS <= 0
double compute_work_life_factor(const EarningsParams& params, double derived_yfs);

// Run the ordered adjustment chain:
//   WLF -> unemployment -> fringe -> tax on base only -> personal consumption
// The order matters: tax is levied on the unemployment-adjusted base and
// never on the fringe portion.
Algebraic compute_algebraic(
    const EarningsParams& params,
    const DateCalc& date_calc,
    bool union_mode
);

} // namespace damagecalc

#endif // DAMAGECALC_ALGEBRAIC_HPP
