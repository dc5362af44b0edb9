#ifndef DAMAGECALC_LIFE_CARE_PLAN_HPP
#define DAMAGECALC_LIFE_CARE_PLAN_HPP

#include "cpi_table.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace damagecalc {

// Scheduling modes for a life care plan item
struct AnnualFrequency {};

struct OneTimeFrequency {};

struct RecurringFrequency {
    int interval;                   // Every Nth year from the start year (>= 1)
};

// Explicit plan years; replaces start/duration/end entirely
struct CustomYearsFrequency {
    std::vector<int> years;
};

using LcpFrequency = std::variant<AnnualFrequency, OneTimeFrequency,
                                  RecurringFrequency, CustomYearsFrequency>;

// "annual", "onetime", "recurring" or "custom"
std::string frequency_name(const LcpFrequency& frequency);

struct LcpItem {
    int id;
    std::string category_id;        // Selects the CPI rate
    std::string name;
    double base_cost;               // Cost in plan year 1 dollars
    LcpFrequency frequency;
    int duration;                   // Years, counted from start_year
    int start_year;                 // 1-based plan year, clamped to >= 1
    int end_year;                   // 0 = derived from duration
    std::optional<double> cpi;      // Overrides the category rate when set

    LcpItem();
};

// Valued item with its nominal and present-value totals
struct LcpItemValue {
    LcpItem item;
    double cpi_rate;                // Inflation rate actually applied
    double total_nom;
    double total_pv;
};

struct LcpData {
    std::vector<LcpItemValue> items;
    double total_nom;
    double total_pv;

    LcpData();
};

// Last plan year an item can be active in
constexpr int MAX_PLAN_YEAR = 150;

// Plan years (1-based, ascending) in which an item incurs its cost.
// Custom years are filtered to 1..MAX_PLAN_YEAR, deduplicated and sorted;
// an empty custom set falls back to every year in range. Ranges are
// clamped to MAX_PLAN_YEAR.
std::vector<int> resolve_active_years(const LcpItem& item);

// Inflation rate for an item: its own override, else its category rate
double resolve_item_cpi(const LcpItem& item, const CpiCategoryTable& table);

// Value every item. Cost in plan year y is inflated from year 1,
// base x (1 + cpi)^(y - 1), and discounted mid-year on the absolute plan
// year, 1 / (1 + r)^(y - 0.5), so later-starting items are discounted for
// the full wait.
LcpData compute_life_care_plan(
    const std::vector<LcpItem>& items,
    double discount_rate,
    const CpiCategoryTable& table,
    bool enable_present_value = true
);

} // namespace damagecalc

#endif // DAMAGECALC_LIFE_CARE_PLAN_HPP
