#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "schedule.hpp"
#include "algebraic.hpp"
#include "household.hpp"

using namespace damagecalc;
using Catch::Approx;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

CaseInfo create_case() {
    CaseInfo info;
    info.date_of_birth = "1990-01-01";
    info.date_of_injury = "2020-01-01";
    info.date_of_trial = "2024-01-01";
    info.retirement_age = 67.0;
    return info;
}

EarningsParams create_params() {
    EarningsParams params;
    params.base_earnings = 50000.0;
    params.residual_earnings = 10000.0;
    params.wle = 30.0;
    return params;
}

LcpItem create_item(const std::string& name, double base_cost, LcpFrequency frequency,
                    int duration) {
    LcpItem item;
    item.category_id = "evals";
    item.name = name;
    item.base_cost = base_cost;
    item.frequency = std::move(frequency);
    item.duration = duration;
    return item;
}

} // anonymous namespace

// ============================================================================
// Earnings Schedule
// ============================================================================

TEST_CASE("Scenario schedule follows the projection path", "[schedule]") {
    CaseInfo info = create_case();
    EarningsParams params = create_params();
    DateCalc dc = compute_date_calc(info, CalendarDate{2025, 1, 1});

    auto rows = compute_detailed_scenario_schedule(info, params, dc, 67.0, false, 2024);

    Algebraic a = compute_algebraic(params, dc, false);
    Projection proj = compute_projection(info, params, a, PastActuals(), dc);

    REQUIRE(rows.size() == proj.future_schedule.size());
    REQUIRE(rows.front().year_num == 1);
    REQUIRE(rows.front().calendar_year == 2024);
    REQUIRE(rows[5].calendar_year == 2029);
    REQUIRE_FALSE(rows.front().is_past);
    REQUIRE(rows.front().net_loss == Approx(proj.future_schedule.front().net_loss));
    REQUIRE(rows.back().cum_pv == Approx(proj.total_future_pv));
}

TEST_CASE("Scenario schedule length tracks the retirement age", "[schedule]") {
    CaseInfo info = create_case();
    EarningsParams params = create_params();
    DateCalc dc = compute_date_calc(info, CalendarDate{2025, 1, 1});

    auto age65 = compute_detailed_scenario_schedule(info, params, dc, 65.0, false, 2024);
    auto age70 = compute_detailed_scenario_schedule(info, params, dc, 70.0, false, 2024);

    REQUIRE(age70.size() == age65.size() + 5);
    // Shorter horizon raises the work-life factor, so per-year losses differ
    REQUIRE(age65.front().net_loss > age70.front().net_loss);
}

TEST_CASE("Scenario schedule is empty without birth or injury date", "[schedule]") {
    CaseInfo info = create_case();
    info.date_of_birth = "";
    auto rows = compute_detailed_scenario_schedule(
        info, create_params(), DateCalc(), 67.0, false, 2024);
    REQUIRE(rows.empty());

    SECTION("retirement age before injury") {
        CaseInfo valid = create_case();
        DateCalc dc = compute_date_calc(valid, CalendarDate{2025, 1, 1});
        auto none = compute_detailed_scenario_schedule(valid, create_params(), dc, 25.0, false, 2024);
        REQUIRE(none.empty());
    }
}

// ============================================================================
// Life Care Plan Schedule
// ============================================================================

TEST_CASE("LCP schedule groups items by plan year", "[schedule]") {
    std::vector<LcpItem> items;
    items.push_back(create_item("Evaluations", 1000.0, AnnualFrequency{}, 3));
    items.push_back(create_item("Surgery", 5000.0, OneTimeFrequency{}, 1));
    items.back().start_year = 2;
    items.push_back(create_item("Equipment", 800.0, CustomYearsFrequency{{5}}, 1));

    CpiCategoryTable table = CpiCategoryTable::default_table();
    auto rows = compute_detailed_lcp_schedule(items, 4.0, table, 2024);

    REQUIRE(rows.size() == 4);
    REQUIRE(rows[0].year_num == 1);
    REQUIRE(rows[0].calendar_year == 2024);
    REQUIRE(rows[0].items.size() == 1);
    REQUIRE(rows[1].year_num == 2);
    REQUIRE(rows[1].items.size() == 2);
    REQUIRE(rows[3].year_num == 5);
    REQUIRE(rows[3].calendar_year == 2028);
    REQUIRE(rows[3].items[0].name == "Equipment");

    LcpData data = compute_life_care_plan(items, 4.0, table);
    REQUIRE(rows.back().cum_pv == Approx(data.total_pv));

    double total_inflated = 0.0;
    for (const auto& row : rows) {
        total_inflated += row.total_inflated;
    }
    REQUIRE(total_inflated == Approx(data.total_nom));
}

TEST_CASE("LCP schedule is empty without items", "[schedule]") {
    auto rows = compute_detailed_lcp_schedule(
        {}, 4.0, CpiCategoryTable::default_table(), 2024);
    REQUIRE(rows.empty());
}

// ============================================================================
// Household Services Schedule
// ============================================================================

TEST_CASE("HHS schedule accumulates to the household total", "[schedule]") {
    HhServices services;
    services.active = true;
    services.hours_per_week = 10.0;
    services.hourly_rate = 20.0;
    services.growth_rate = 2.0;
    services.discount_rate = 3.0;

    auto rows = compute_detailed_hhs_schedule(services, 4.5, 2025);
    HhsData data = compute_household_services(services, 4.5);

    REQUIRE(rows.size() == 5);
    REQUIRE(rows.front().annual_value == Approx(10400.0));
    REQUIRE(rows.back().calendar_year == 2029);
    REQUIRE(rows.back().cum_pv == Approx(data.total_pv));

    SECTION("inactive services produce no rows") {
        services.active = false;
        REQUIRE(compute_detailed_hhs_schedule(services, 4.5, 2025).empty());
    }
}

// ============================================================================
// Period Rows
// ============================================================================

TEST_CASE("Period rows merge past and future schedules", "[schedule]") {
    Projection proj;

    PastScheduleRow past{};
    past.year = 2020;
    past.gross_base = 50000.0;
    past.net_loss = 20000.0;
    proj.past_schedule.push_back(past);
    past.year = 2021;
    past.net_loss = 21000.0;
    proj.past_schedule.push_back(past);

    FutureScheduleRow future{};
    future.year = 1;
    future.calendar_year = 2022;
    future.gross = 52000.0;
    future.net_loss = 22000.0;
    future.discount_factor = 0.98;
    future.pv = 22000.0 * 0.98;
    proj.future_schedule.push_back(future);

    auto rows = compute_period_rows(proj);

    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].period_type == PeriodType::Past);
    REQUIRE(rows[0].year_num == 1);
    REQUIRE(rows[1].year_num == 2);
    REQUIRE(rows[1].calendar_year == 2021);
    REQUIRE(rows[1].discount_factor == 1.0);
    REQUIRE(rows[1].present_value == Approx(21000.0));
    REQUIRE(rows[1].cumulative_pv == Approx(41000.0));

    REQUIRE(rows[2].period_type == PeriodType::Future);
    REQUIRE(rows[2].calendar_year == 2022);
    REQUIRE(rows[2].discount_factor == Approx(0.98));
    REQUIRE(rows[2].cumulative_pv == Approx(41000.0 + 21560.0));

    REQUIRE(period_type_to_string(PeriodType::Past) == "past");
    REQUIRE(period_type_to_string(PeriodType::Future) == "future");
}
