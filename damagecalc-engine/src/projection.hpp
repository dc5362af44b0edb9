#ifndef DAMAGECALC_PROJECTION_HPP
#define DAMAGECALC_PROJECTION_HPP

#include "case_info.hpp"
#include "date_calc.hpp"
#include "algebraic.hpp"
#include <map>
#include <string>
#include <vector>

namespace damagecalc {

// Manually entered actual earnings by calendar year, as typed
using PastActuals = std::map<int, std::string>;

// One elapsed year between injury and trial
struct PastScheduleRow {
    int year;                       // Calendar year
    std::string label;              // "Past-1", "Past-2", ...
    double gross_base;              // But-for gross earnings x fraction
    double gross_actual;            // Manual actual, or residual x fraction
    double net_loss;                // Net but-for minus net actual
    bool is_manual;                 // Gross actual came from a manual entry
    double fraction;                // Portion of the year elapsed (0, 1]
};

// One projected year from trial to final separation
struct FutureScheduleRow {
    int year;                       // 1-based projection year
    int calendar_year;
    double gross;                   // But-for gross earnings
    double net_loss;
    double discount_factor;         // Mid-year: 1 / (1 + r)^(year - 0.5)
    double pv;                      // net_loss x discount_factor
};

struct Projection {
    std::vector<PastScheduleRow> past_schedule;
    std::vector<FutureScheduleRow> future_schedule;
    double total_past_loss;         // Sum of past net_loss
    double total_future_nominal;    // Sum of future net_loss
    double total_future_pv;         // Sum of future pv

    Projection();
};

// Year in which the future projection starts: the configured era split
// year, else the trial year, else injury year + whole past years.
int resolve_era_split_year(const CaseInfo& case_info,
                           const EarningsParams& params,
                           const DateCalc& date_calc);

// Project past and future earnings losses.
//
// Past loop: one row per elapsed year from the injury year, the final row
// weighted by the fractional remainder of past_years. Each row nets
// but-for earnings (base x growth^i x fraction x era 1 AIF) against actual
// earnings: a manual entry for that calendar year netted with the realized
// multiplier, otherwise residual earnings netted with the era 1 AIF.
//
// Future loop: ceil(YFS) rows of base minus residual earnings, grown at the
// future rate, netted with the era 2 AIF and discounted with the mid-year
// convention. Returns an empty projection when the injury date is missing.
Projection compute_projection(
    const CaseInfo& case_info,
    const EarningsParams& params,
    const Algebraic& algebraic,
    const PastActuals& past_actuals,
    const DateCalc& date_calc
);

} // namespace damagecalc

#endif // DAMAGECALC_PROJECTION_HPP
