#include "household.hpp"
#include "numeric.hpp"
#include <cmath>

namespace damagecalc {

HhsData::HhsData() : total_nom(0.0), total_pv(0.0) {}

double household_annual_value(const HhServices& services, int year_index) {
    return services.hours_per_week * WEEKS_PER_YEAR * services.hourly_rate *
           growth_factor(services.growth_rate, year_index);
}

HhsData compute_household_services(
    const HhServices& services,
    double derived_yfs,
    bool enable_present_value)
{
    HhsData result;
    if (!services.active) {
        return result;
    }

    const int years = static_cast<int>(std::ceil(derived_yfs));
    for (int i = 0; i < years; ++i) {
        const double annual_value = household_annual_value(services, i);
        const double discount =
            mid_year_discount(services.discount_rate, i, enable_present_value);
        result.total_nom += annual_value;
        result.total_pv += annual_value * discount;
    }

    return result;
}

} // namespace damagecalc
