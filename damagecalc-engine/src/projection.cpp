#include "projection.hpp"
#include "numeric.hpp"
#include <cmath>
#include <optional>
#include <utility>

namespace damagecalc {

// ============================================================================
// Projection Implementation
// ============================================================================

Projection::Projection()
    : total_past_loss(0.0), total_future_nominal(0.0), total_future_pv(0.0) {}

int resolve_era_split_year(const CaseInfo& case_info,
                           const EarningsParams& params,
                           const DateCalc& date_calc)
{
    if (params.use_era_split) {
        return params.era_split_year;
    }
    if (const auto trial = parse_date(case_info.date_of_trial)) {
        return trial->year;
    }
    const auto injury = parse_date(case_info.date_of_injury);
    const int injury_year = injury ? injury->year : 0;
    return injury_year + static_cast<int>(std::floor(date_calc.past_years));
}

Projection compute_projection(
    const CaseInfo& case_info,
    const EarningsParams& params,
    const Algebraic& algebraic,
    const PastActuals& past_actuals,
    const DateCalc& date_calc)
{
    Projection result;

    const auto injury = parse_date(case_info.date_of_injury);
    if (!injury) {
        return result;
    }

    const int start_year = injury->year;
    const int full_past = static_cast<int>(std::floor(date_calc.past_years));
    const double partial_past = std::fmod(date_calc.past_years, 1.0);

    // --- Past losses: injury to trial, not discounted ---

    result.past_schedule.reserve(full_past + 1);
    for (int i = 0; i <= full_past; ++i) {
        const double fraction = i < full_past ? 1.0 : partial_past;
        if (fraction <= 0.0) {
            continue;
        }

        const int calendar_year = start_year + i;
        const double growth = growth_factor(params.past_wage_growth(), i);
        const double gross_base = params.base_earnings * growth * fraction;
        const double net_but_for = gross_base * algebraic.era1_aif;

        PastScheduleRow row;
        row.year = calendar_year;
        row.label = "Past-" + std::to_string(i + 1);
        row.gross_base = gross_base;
        row.fraction = fraction;
        row.is_manual = false;

        std::optional<double> manual;
        auto it = past_actuals.find(calendar_year);
        if (it != past_actuals.end()) {
            manual = parse_number(it->second);
        }

        double net_actual;
        if (manual) {
            row.gross_actual = *manual;
            row.is_manual = true;
            net_actual = row.gross_actual * algebraic.realized_multiplier;
        } else {
            row.gross_actual = params.residual_earnings * growth * fraction;
            net_actual = row.gross_actual * algebraic.era1_aif;
        }

        row.net_loss = net_but_for - net_actual;
        result.total_past_loss += row.net_loss;
        result.past_schedule.push_back(std::move(row));
    }

    // --- Future losses: discounted to present value ---

    const int split_year = resolve_era_split_year(case_info, params, date_calc);
    const int future_years = static_cast<int>(std::ceil(algebraic.yfs));
    if (future_years > 0) {
        result.future_schedule.reserve(future_years);
    }

    for (int i = 0; i < future_years; ++i) {
        const double growth = growth_factor(params.future_wage_growth(), i);
        const double discount =
            mid_year_discount(params.discount_rate, i, params.enable_present_value);

        const double gross_base = params.base_earnings * growth;
        const double net_but_for = gross_base * algebraic.era2_aif;
        const double net_actual = params.residual_earnings * growth * algebraic.era2_aif;

        FutureScheduleRow row;
        row.year = i + 1;
        row.calendar_year = split_year + i;
        row.gross = gross_base;
        row.net_loss = net_but_for - net_actual;
        row.discount_factor = discount;
        row.pv = row.net_loss * discount;

        result.total_future_nominal += row.net_loss;
        result.total_future_pv += row.pv;
        result.future_schedule.push_back(row);
    }

    return result;
}

} // namespace damagecalc
