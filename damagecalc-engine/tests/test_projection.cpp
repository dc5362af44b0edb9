#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "projection.hpp"

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
    info.date_of_trial = "2022-07-02";
    return info;
}

EarningsParams create_params() {
    EarningsParams p;
    p.base_earnings = 60000.0;
    p.residual_earnings = 20000.0;
    p.wle = 8.0;
    p.wage_growth = 3.0;
    p.discount_rate = 5.0;
    p.fringe_rate = 10.0;
    p.unemployment_rate = 4.0;
    p.ui_replacement_rate = 50.0;
    p.fed_tax_rate = 15.0;
    p.state_tax_rate = 5.0;
    return p;
}

DateCalc create_dates(double past_years, double yfs) {
    DateCalc dc;
    dc.past_years = past_years;
    dc.derived_yfs = yfs;
    return dc;
}

Projection project(const CaseInfo& info, const EarningsParams& p, const DateCalc& dc,
                   const PastActuals& actuals = PastActuals()) {
    Algebraic a = compute_algebraic(p, dc, false);
    return compute_projection(info, p, a, actuals, dc);
}

} // anonymous namespace

// ============================================================================
// Past Schedule
// ============================================================================

TEST_CASE("Projection without an injury date is empty", "[projection]") {
    CaseInfo info = create_case();
    info.date_of_injury = "";
    Projection proj = project(info, create_params(), create_dates(2.5, 10.0));

    REQUIRE(proj.past_schedule.empty());
    REQUIRE(proj.future_schedule.empty());
    REQUIRE(proj.total_past_loss == 0.0);
    REQUIRE(proj.total_future_pv == 0.0);
    REQUIRE(proj.total_future_nominal == 0.0);
}

TEST_CASE("Past schedule covers whole years plus the partial final year", "[projection]") {
    Projection proj = project(create_case(), create_params(), create_dates(2.5, 10.0));

    REQUIRE(proj.past_schedule.size() == 3);
    REQUIRE(proj.past_schedule[0].label == "Past-1");
    REQUIRE(proj.past_schedule[2].label == "Past-3");
    REQUIRE(proj.past_schedule[0].year == 2020);
    REQUIRE(proj.past_schedule[1].year == 2021);
    REQUIRE(proj.past_schedule[2].year == 2022);
    REQUIRE(proj.past_schedule[0].fraction == 1.0);
    REQUIRE(proj.past_schedule[1].fraction == 1.0);
    REQUIRE(proj.past_schedule[2].fraction == Approx(0.5));
}

TEST_CASE("Whole past years produce no empty partial row", "[projection]") {
    Projection proj = project(create_case(), create_params(), create_dates(2.0, 10.0));
    REQUIRE(proj.past_schedule.size() == 2);

    Projection none = project(create_case(), create_params(), create_dates(0.0, 10.0));
    REQUIRE(none.past_schedule.empty());
    REQUIRE(none.total_past_loss == 0.0);
}

TEST_CASE("Past rows net but-for against residual earnings", "[projection]") {
    EarningsParams p = create_params();
    DateCalc dc = create_dates(2.5, 10.0);
    Algebraic a = compute_algebraic(p, dc, false);
    Projection proj = compute_projection(create_case(), p, a, PastActuals(), dc);

    for (size_t i = 0; i < proj.past_schedule.size(); ++i) {
        const auto& row = proj.past_schedule[i];
        const double growth = std::pow(1.03, static_cast<double>(i));
        REQUIRE(row.gross_base == Approx(60000.0 * growth * row.fraction));
        REQUIRE(row.gross_actual == Approx(20000.0 * growth * row.fraction));
        REQUIRE(row.net_loss == Approx((row.gross_base - row.gross_actual) * a.era1_aif));
        REQUIRE_FALSE(row.is_manual);
    }
}

TEST_CASE("Past totals equal the sum of rows", "[projection]") {
    Projection proj = project(create_case(), create_params(), create_dates(3.7, 12.3));

    double past = 0.0;
    for (const auto& row : proj.past_schedule) {
        past += row.net_loss;
    }
    double nominal = 0.0;
    double pv = 0.0;
    for (const auto& row : proj.future_schedule) {
        nominal += row.net_loss;
        pv += row.pv;
    }

    REQUIRE(proj.total_past_loss == Approx(past));
    REQUIRE(proj.total_future_nominal == Approx(nominal));
    REQUIRE(proj.total_future_pv == Approx(pv));
}

TEST_CASE("Manual actual earnings replace the residual path", "[projection]") {
    EarningsParams p = create_params();
    DateCalc dc = create_dates(2.5, 10.0);
    Algebraic a = compute_algebraic(p, dc, false);

    PastActuals actuals;
    actuals[2021] = "30,000";
    actuals[2022] = "12000";
    Projection proj = compute_projection(create_case(), p, a, actuals, dc);

    SECTION("netted with the realized multiplier") {
        const auto& row = proj.past_schedule[1];
        REQUIRE(row.is_manual);
        REQUIRE(row.gross_actual == 30000.0);
        REQUIRE(row.net_loss == Approx(row.gross_base * a.era1_aif - 30000.0 * a.realized_multiplier));
    }

    SECTION("not scaled by the partial year fraction") {
        const auto& row = proj.past_schedule[2];
        REQUIRE(row.is_manual);
        REQUIRE(row.fraction == Approx(0.5));
        REQUIRE(row.gross_actual == 12000.0);
    }

    SECTION("years without an entry are unaffected") {
        REQUIRE_FALSE(proj.past_schedule[0].is_manual);
    }
}

TEST_CASE("Unparseable manual actual behaves like no entry", "[projection]") {
    Projection baseline = project(create_case(), create_params(), create_dates(2.5, 10.0));

    for (const std::string& junk : {std::string(""), std::string("n/a"), std::string("$5k")}) {
        PastActuals actuals;
        actuals[2021] = junk;
        Projection proj = project(create_case(), create_params(), create_dates(2.5, 10.0), actuals);

        REQUIRE_FALSE(proj.past_schedule[1].is_manual);
        REQUIRE(proj.past_schedule[1].gross_actual == baseline.past_schedule[1].gross_actual);
        REQUIRE(proj.past_schedule[1].net_loss == baseline.past_schedule[1].net_loss);
        REQUIRE(proj.total_past_loss == baseline.total_past_loss);
    }
}

// ============================================================================
// Future Schedule
// ============================================================================

TEST_CASE("Future schedule runs ceil(YFS) years from the trial year", "[projection]") {
    Projection proj = project(create_case(), create_params(), create_dates(2.5, 10.2));

    REQUIRE(proj.future_schedule.size() == 11);
    REQUIRE(proj.future_schedule.front().year == 1);
    REQUIRE(proj.future_schedule.front().calendar_year == 2022);
    REQUIRE(proj.future_schedule.back().year == 11);
    REQUIRE(proj.future_schedule.back().calendar_year == 2032);
}

TEST_CASE("Future rows discount with the mid-year convention", "[projection]") {
    EarningsParams p = create_params();
    DateCalc dc = create_dates(2.5, 10.0);
    Algebraic a = compute_algebraic(p, dc, false);
    Projection proj = compute_projection(create_case(), p, a, PastActuals(), dc);

    for (const auto& row : proj.future_schedule) {
        const int i = row.year - 1;
        const double growth = std::pow(1.03, i);
        REQUIRE(row.gross == Approx(60000.0 * growth));
        REQUIRE(row.net_loss == Approx((60000.0 - 20000.0) * growth * a.era2_aif));
        REQUIRE(row.discount_factor == Approx(1.0 / std::pow(1.05, i + 0.5)));
        REQUIRE(row.pv == Approx(row.net_loss * row.discount_factor));
    }
}

TEST_CASE("Disabling present value leaves future losses nominal", "[projection]") {
    EarningsParams p = create_params();
    p.enable_present_value = false;
    Projection proj = project(create_case(), p, create_dates(2.5, 10.0));

    for (const auto& row : proj.future_schedule) {
        REQUIRE(row.discount_factor == 1.0);
    }
    REQUIRE(proj.total_future_pv == Approx(proj.total_future_nominal));
}

TEST_CASE("Zero YFS yields no future rows", "[projection]") {
    Projection proj = project(create_case(), create_params(), create_dates(2.5, 0.0));
    REQUIRE(proj.future_schedule.empty());
    REQUIRE(proj.total_future_pv == 0.0);
}

// ============================================================================
// Era Split
// ============================================================================

TEST_CASE("resolve_era_split_year fallbacks", "[projection]") {
    EarningsParams p = create_params();
    DateCalc dc = create_dates(2.5, 10.0);

    SECTION("configured split year wins") {
        p.use_era_split = true;
        p.era_split_year = 2023;
        REQUIRE(resolve_era_split_year(create_case(), p, dc) == 2023);
    }

    SECTION("trial year without a split") {
        REQUIRE(resolve_era_split_year(create_case(), p, dc) == 2022);
    }

    SECTION("injury year plus whole past years without a trial date") {
        CaseInfo info = create_case();
        info.date_of_trial = "";
        REQUIRE(resolve_era_split_year(info, p, dc) == 2022);
    }
}

TEST_CASE("Era split uses separate past and future growth", "[projection]") {
    EarningsParams p = create_params();
    p.use_era_split = true;
    p.era_split_year = 2023;
    p.era1_wage_growth = 2.0;
    p.era2_wage_growth = 4.0;
    Projection proj = project(create_case(), p, create_dates(2.5, 10.0));

    REQUIRE(proj.past_schedule[1].gross_base == Approx(60000.0 * 1.02));
    REQUIRE(proj.future_schedule[1].gross == Approx(60000.0 * 1.04));
    REQUIRE(proj.future_schedule.front().calendar_year == 2023);
}

TEST_CASE("Wrongful death nets past and future with their era multipliers", "[projection]") {
    EarningsParams p = create_params();
    p.is_wrongful_death = true;
    p.era1_personal_consumption = 30.0;
    p.era2_personal_consumption = 20.0;
    DateCalc dc = create_dates(2.5, 10.0);
    Algebraic a = compute_algebraic(p, dc, false);
    Projection proj = compute_projection(create_case(), p, a, PastActuals(), dc);

    REQUIRE(proj.past_schedule[0].net_loss == Approx(40000.0 * a.era1_aif));
    REQUIRE(proj.future_schedule[0].net_loss == Approx(40000.0 * a.era2_aif));
    REQUIRE(a.era2_aif > a.era1_aif);
}
