#include "algebraic.hpp"

namespace damagecalc {

Algebraic::Algebraic()
    : yfs(0.0), wlf(0.0), unemployment_factor(1.0), fringe_factor(1.0),
      flat_fringe_amount(0.0), combined_tax_rate(0.0), after_tax_factor(1.0),
      worklife_adjusted_base(0.0), unemployment_adjusted_base(0.0),
      gross_compensation_with_fringes(0.0), tax_on_base_earnings(0.0),
      after_tax_compensation(0.0), era1_personal_consumption(0.0),
      era2_personal_consumption(0.0), era1_aif(0.0), era2_aif(0.0),
      full_multiplier(0.0), realized_multiplier(1.0) {}

double combined_tax_rate(double fed_tax_percent, double state_tax_percent) {
    return 1.0 - (1.0 - fed_tax_percent / 100.0) * (1.0 - state_tax_percent / 100.0);
}

double compute_work_life_factor(const EarningsParams& params, double derived_yfs) {
    if (derived_yfs <= 0.0) {
        return 0.0;
    }
    return (params.wle / derived_yfs) * 100.0;
}

Algebraic compute_algebraic(
    const EarningsParams& params,
    const DateCalc& date_calc,
    bool union_mode)
{
    Algebraic a;

    // Step 1: work-life factor
    a.yfs = date_calc.derived_yfs;
    a.wlf = a.yfs > 0.0 ? params.wle / a.yfs : 0.0;

    // Step 2: unemployment, net of UI benefits replacing part of the loss
    a.unemployment_factor =
        1.0 - (params.unemployment_rate / 100.0) * (1.0 - params.ui_replacement_rate / 100.0);

    // Step 3: fringe benefits
    if (params.enable_fringe_benefits) {
        if (union_mode) {
            a.flat_fringe_amount = params.flat_fringe_total();
            const double effective_rate = params.base_earnings > 0.0
                ? a.flat_fringe_amount / params.base_earnings
                : 0.0;
            a.fringe_factor = 1.0 + effective_rate;
        } else {
            a.fringe_factor = 1.0 + params.fringe_rate / 100.0;
        }
    }

    // Step 4: taxes
    a.combined_tax_rate = combined_tax_rate(params.fed_tax_rate, params.state_tax_rate);
    a.after_tax_factor = 1.0 - a.combined_tax_rate;

    a.worklife_adjusted_base = a.wlf;
    a.unemployment_adjusted_base = a.worklife_adjusted_base * a.unemployment_factor;
    a.gross_compensation_with_fringes = a.unemployment_adjusted_base * a.fringe_factor;
    a.tax_on_base_earnings = a.unemployment_adjusted_base * a.combined_tax_rate;
    a.after_tax_compensation = a.gross_compensation_with_fringes - a.tax_on_base_earnings;

    // Step 5: personal consumption, wrongful death only
    if (params.is_wrongful_death) {
        a.era1_personal_consumption = params.era1_personal_consumption / 100.0;
        a.era2_personal_consumption = params.era2_personal_consumption / 100.0;
    }
    a.era1_aif = a.after_tax_compensation * (1.0 - a.era1_personal_consumption);
    a.era2_aif = a.after_tax_compensation * (1.0 - a.era2_personal_consumption);

    a.full_multiplier = params.is_wrongful_death ? a.era1_aif : a.after_tax_compensation;

    // Actual earnings already reflect worklife and unemployment
    a.realized_multiplier = a.after_tax_factor * a.fringe_factor;

    return a;
}

} // namespace damagecalc
