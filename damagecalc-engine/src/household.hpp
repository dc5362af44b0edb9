#ifndef DAMAGECALC_HOUSEHOLD_HPP
#define DAMAGECALC_HOUSEHOLD_HPP

#include "case_info.hpp"

namespace damagecalc {

constexpr double WEEKS_PER_YEAR = 52.0;

struct HhsData {
    double total_nom;
    double total_pv;

    HhsData();
};

// Annual replacement value of household services in year `year_index`
// (0-based): hours/week x 52 x hourly rate x (1 + growth)^i
double household_annual_value(const HhServices& services, int year_index);

// Value lost household services over ceil(derived_yfs) years, discounted
// with the mid-year convention. All zeros when the services are inactive.
HhsData compute_household_services(
    const HhServices& services,
    double derived_yfs,
    bool enable_present_value = true
);

} // namespace damagecalc

#endif // DAMAGECALC_HOUSEHOLD_HPP
