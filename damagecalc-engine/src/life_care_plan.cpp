#include "life_care_plan.hpp"
#include "numeric.hpp"
#include <algorithm>
#include <cstdint>

namespace damagecalc {

namespace {

// Overload set for std::visit
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

std::string frequency_name(const LcpFrequency& frequency) {
    return std::visit(Overloaded{
        [](const AnnualFrequency&) { return std::string("annual"); },
        [](const OneTimeFrequency&) { return std::string("onetime"); },
        [](const RecurringFrequency&) { return std::string("recurring"); },
        [](const CustomYearsFrequency&) { return std::string("custom"); },
    }, frequency);
}

// ============================================================================
// LcpItem Implementation
// ============================================================================

LcpItem::LcpItem()
    : id(0), base_cost(0.0), frequency(AnnualFrequency{}),
      duration(1), start_year(1), end_year(0) {}

LcpData::LcpData() : total_nom(0.0), total_pv(0.0) {}

std::vector<int> resolve_active_years(const LcpItem& item) {
    std::vector<int> years;

    if (const auto* custom = std::get_if<CustomYearsFrequency>(&item.frequency)) {
        for (int y : custom->years) {
            if (y > 0 && y <= MAX_PLAN_YEAR) {
                years.push_back(y);
            }
        }
        std::sort(years.begin(), years.end());
        years.erase(std::unique(years.begin(), years.end()), years.end());
        if (!years.empty()) {
            return years;
        }
    }

    const int start = std::max(1, item.start_year);
    if (start > MAX_PLAN_YEAR) {
        return years;
    }
    const int64_t span_end = static_cast<int64_t>(start) + item.duration - 1;
    const int end = static_cast<int>(std::min<int64_t>(
        MAX_PLAN_YEAR, std::max<int64_t>(item.end_year, span_end)));
    const int duration = std::max(0, end - start + 1);

    for (int t = 0; t < duration; ++t) {
        const bool active = std::visit(Overloaded{
            [](const AnnualFrequency&) { return true; },
            [t](const OneTimeFrequency&) { return t == 0; },
            [t](const RecurringFrequency& r) { return t % std::max(1, r.interval) == 0; },
            [](const CustomYearsFrequency&) { return true; },
        }, item.frequency);
        if (active) {
            years.push_back(start + t);
        }
    }

    return years;
}

double resolve_item_cpi(const LcpItem& item, const CpiCategoryTable& table) {
    if (item.cpi) {
        return *item.cpi;
    }
    return table.get_rate(item.category_id);
}

LcpData compute_life_care_plan(
    const std::vector<LcpItem>& items,
    double discount_rate,
    const CpiCategoryTable& table,
    bool enable_present_value)
{
    LcpData result;
    result.items.reserve(items.size());

    for (const auto& item : items) {
        LcpItemValue value{item, resolve_item_cpi(item, table), 0.0, 0.0};

        for (int year : resolve_active_years(item)) {
            const int t = year - 1;
            const double inflated = item.base_cost * growth_factor(value.cpi_rate, t);
            const double discount = mid_year_discount(discount_rate, t, enable_present_value);
            value.total_nom += inflated;
            value.total_pv += inflated * discount;
        }

        result.total_nom += value.total_nom;
        result.total_pv += value.total_pv;
        result.items.push_back(std::move(value));
    }

    return result;
}

} // namespace damagecalc
