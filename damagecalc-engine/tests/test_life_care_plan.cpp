#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <climits>
#include <cmath>
#include "life_care_plan.hpp"

using namespace damagecalc;
using Catch::Approx;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

LcpItem create_item(double base_cost, LcpFrequency frequency, int duration = 1,
                    int start_year = 1) {
    LcpItem item;
    item.id = 1;
    item.category_id = "custom";
    item.name = "Test item";
    item.base_cost = base_cost;
    item.frequency = std::move(frequency);
    item.duration = duration;
    item.start_year = start_year;
    return item;
}

CpiCategoryTable flat_table(double rate) {
    CpiCategoryTable table("test");
    table.set("custom", "Custom Rate", rate);
    return table;
}

} // anonymous namespace

// ============================================================================
// Active Years
// ============================================================================

TEST_CASE("Annual items run every year in range", "[lcp]") {
    LcpItem item = create_item(1000.0, AnnualFrequency{}, 4, 2);
    REQUIRE(resolve_active_years(item) == std::vector<int>{2, 3, 4, 5});
}

TEST_CASE("One-time items occur in the start year only", "[lcp]") {
    LcpItem item = create_item(1000.0, OneTimeFrequency{}, 10, 3);
    REQUIRE(resolve_active_years(item) == std::vector<int>{3});
}

TEST_CASE("Recurring items occur every Nth year from the start", "[lcp]") {
    LcpItem item = create_item(1000.0, RecurringFrequency{2}, 5, 1);
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 3, 5});

    SECTION("interval below one is treated as annual") {
        item.frequency = RecurringFrequency{0};
        REQUIRE(resolve_active_years(item).size() == 5);
    }
}

TEST_CASE("Custom years override duration and end year", "[lcp]") {
    LcpItem item = create_item(1000.0, CustomYearsFrequency{{7, 2, 7, -1, 0, 4}}, 30, 1);
    item.end_year = 40;
    REQUIRE(resolve_active_years(item) == std::vector<int>{2, 4, 7});
}

TEST_CASE("Empty custom years fall back to every year in range", "[lcp]") {
    LcpItem item = create_item(1000.0, CustomYearsFrequency{{}}, 3, 1);
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 2, 3});

    item.frequency = CustomYearsFrequency{{0, -2}};
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 2, 3});
}

TEST_CASE("Start year is clamped and end year can extend the range", "[lcp]") {
    LcpItem item = create_item(1000.0, AnnualFrequency{}, 2, 0);
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 2});

    item.end_year = 4;
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 2, 3, 4});

    // An end year inside the duration does not shorten it
    item.end_year = 1;
    REQUIRE(resolve_active_years(item) == std::vector<int>{1, 2});
}

TEST_CASE("Active years stop at the last plan year", "[lcp]") {
    SECTION("start year at the integer limit") {
        LcpItem item = create_item(1000.0, AnnualFrequency{}, 2, INT_MAX);
        REQUIRE(resolve_active_years(item).empty());
    }

    SECTION("very long duration") {
        LcpItem item = create_item(1000.0, AnnualFrequency{}, 2000000000, 1);
        auto years = resolve_active_years(item);
        REQUIRE(years.size() == static_cast<size_t>(MAX_PLAN_YEAR));
        REQUIRE(years.back() == MAX_PLAN_YEAR);
    }

    SECTION("end year past the limit") {
        LcpItem item = create_item(1000.0, AnnualFrequency{}, 1, MAX_PLAN_YEAR - 1);
        item.end_year = INT_MAX;
        REQUIRE(resolve_active_years(item) == std::vector<int>{MAX_PLAN_YEAR - 1, MAX_PLAN_YEAR});
    }

    SECTION("custom years past the limit are dropped") {
        LcpItem item = create_item(1000.0, CustomYearsFrequency{{3, MAX_PLAN_YEAR + 1, INT_MAX}});
        REQUIRE(resolve_active_years(item) == std::vector<int>{3});
    }
}

TEST_CASE("frequency_name identifies each mode", "[lcp]") {
    REQUIRE(frequency_name(AnnualFrequency{}) == "annual");
    REQUIRE(frequency_name(OneTimeFrequency{}) == "onetime");
    REQUIRE(frequency_name(RecurringFrequency{3}) == "recurring");
    REQUIRE(frequency_name(CustomYearsFrequency{{1}}) == "custom");
}

// ============================================================================
// Valuation
// ============================================================================

TEST_CASE("One-time item discounted half a year", "[lcp]") {
    std::vector<LcpItem> items = {create_item(5000.0, OneTimeFrequency{})};
    LcpData data = compute_life_care_plan(items, 3.0, flat_table(0.0));

    REQUIRE(data.total_nom == Approx(5000.0));
    REQUIRE(data.total_pv == Approx(5000.0 / std::pow(1.03, 0.5)));
    REQUIRE(data.items.size() == 1);
    REQUIRE(data.items[0].total_pv == Approx(data.total_pv));
}

TEST_CASE("Inflation and discounting use the absolute plan year", "[lcp]") {
    std::vector<LcpItem> items = {create_item(1000.0, OneTimeFrequency{}, 1, 3)};
    LcpData data = compute_life_care_plan(items, 4.0, flat_table(2.0));

    const double inflated = 1000.0 * std::pow(1.02, 2);
    REQUIRE(data.total_nom == Approx(inflated));
    REQUIRE(data.total_pv == Approx(inflated / std::pow(1.04, 2.5)));
}

TEST_CASE("Custom year totals depend only on the year set", "[lcp]") {
    CpiCategoryTable table = flat_table(2.5);
    LcpItem a = create_item(800.0, CustomYearsFrequency{{5, 1, 3}}, 1, 1);
    LcpItem b = create_item(800.0, CustomYearsFrequency{{3, 5, 1, 5}}, 25, 9);
    b.end_year = 60;

    LcpData da = compute_life_care_plan({a}, 4.0, table);
    LcpData db = compute_life_care_plan({b}, 4.0, table);
    REQUIRE(da.total_nom == Approx(db.total_nom));
    REQUIRE(da.total_pv == Approx(db.total_pv));
}

TEST_CASE("Item CPI comes from its override or its category", "[lcp]") {
    CpiCategoryTable table = CpiCategoryTable::default_table();

    LcpItem rx = create_item(100.0, AnnualFrequency{}, 2);
    rx.category_id = "rx";
    REQUIRE(resolve_item_cpi(rx, table) == Approx(1.65));

    rx.cpi = 6.0;
    REQUIRE(resolve_item_cpi(rx, table) == Approx(6.0));

    LcpItem unknown = create_item(100.0, AnnualFrequency{}, 2);
    unknown.category_id = "acupuncture";
    REQUIRE(resolve_item_cpi(unknown, table) == 0.0);

    LcpData data = compute_life_care_plan({rx}, 0.0, table, false);
    REQUIRE(data.items[0].cpi_rate == Approx(6.0));
    REQUIRE(data.total_nom == Approx(100.0 + 106.0));
}

TEST_CASE("Plan totals sum the items", "[lcp]") {
    CpiCategoryTable table = CpiCategoryTable::default_table();
    LcpItem evals = create_item(450.0, AnnualFrequency{}, 10);
    evals.category_id = "evals";
    LcpItem surgery = create_item(18500.0, OneTimeFrequency{}, 1, 3);
    surgery.category_id = "surgery";

    LcpData data = compute_life_care_plan({evals, surgery}, 4.25, table);

    REQUIRE(data.items.size() == 2);
    REQUIRE(data.total_nom == Approx(data.items[0].total_nom + data.items[1].total_nom));
    REQUIRE(data.total_pv == Approx(data.items[0].total_pv + data.items[1].total_pv));
    REQUIRE(data.total_pv < data.total_nom);
}

TEST_CASE("LCP PV equals nominal when discounting is disabled", "[lcp]") {
    LcpItem item = create_item(1000.0, AnnualFrequency{}, 20);
    LcpData data = compute_life_care_plan({item}, 5.0, flat_table(3.0), false);
    REQUIRE(data.total_pv == Approx(data.total_nom));
}

TEST_CASE("Empty plan is worth nothing", "[lcp]") {
    LcpData data = compute_life_care_plan({}, 4.25, CpiCategoryTable::default_table());
    REQUIRE(data.items.empty());
    REQUIRE(data.total_nom == 0.0);
    REQUIRE(data.total_pv == 0.0);
}
