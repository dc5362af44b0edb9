#include "case_loader.hpp"
#include "../numeric.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace damagecalc {
namespace io {

namespace {

void read_string(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return;
    }
    const json& value = obj[key];
    out = value.is_string() ? value.get<std::string>() : value.dump();
}

// Numbers may be typed as JSON numbers or as entered text ("1,250.50").
// Text that does not parse counts as zero.
void read_number(const json& obj, const char* key, double& out) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return;
    }
    const json& value = obj[key];
    if (value.is_number()) {
        out = value.get<double>();
    } else if (value.is_string()) {
        out = number_or_zero(parse_number(value.get<std::string>()));
    } else {
        throw CaseParseError(std::string("Field '") + key + "' must be a number");
    }
}

int to_int(double value, const std::string& what) {
    if (!std::isfinite(value) ||
        value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw CaseParseError(what + " is out of range");
    }
    return static_cast<int>(value);
}

void read_int(const json& obj, const char* key, int& out) {
    double value = out;
    read_number(obj, key, value);
    out = to_int(value, std::string("Field '") + key + "'");
}

// Plan years and durations beyond MAX_PLAN_YEAR are rejected
void read_plan_year(const json& obj, const char* key, int& out) {
    read_int(obj, key, out);
    if (out > MAX_PLAN_YEAR) {
        throw CaseParseError(std::string("Field '") + key + "' exceeds " +
                             std::to_string(MAX_PLAN_YEAR) + " plan years");
    }
}

void read_bool(const json& obj, const char* key, bool& out) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return;
    }
    if (!obj[key].is_boolean()) {
        throw CaseParseError(std::string("Field '") + key + "' must be true or false");
    }
    out = obj[key].get<bool>();
}

const json& require_object(const json& root, const char* key) {
    if (!root.contains(key)) {
        throw CaseParseError(std::string("Missing required section: ") + key);
    }
    if (!root[key].is_object()) {
        throw CaseParseError(std::string("Section '") + key + "' must be an object");
    }
    return root[key];
}

CaseInfo parse_case_info(const json& j) {
    CaseInfo info;
    read_string(j, "plaintiff", info.plaintiff);
    read_string(j, "file_number", info.file_number);
    read_string(j, "attorney", info.attorney);
    read_string(j, "law_firm", info.law_firm);
    read_string(j, "report_date", info.report_date);
    read_string(j, "gender", info.gender);
    read_string(j, "date_of_birth", info.date_of_birth);
    read_string(j, "education", info.education);
    read_string(j, "marital_status", info.marital_status);
    read_string(j, "dependents", info.dependents);
    read_string(j, "city", info.city);
    read_string(j, "county", info.county);
    read_string(j, "state", info.state);
    read_string(j, "date_of_injury", info.date_of_injury);
    read_string(j, "date_of_trial", info.date_of_trial);
    read_number(j, "retirement_age", info.retirement_age);
    read_number(j, "life_expectancy", info.life_expectancy);
    read_string(j, "wle_source", info.wle_source);
    read_string(j, "life_table_source", info.life_table_source);
    read_string(j, "jurisdiction", info.jurisdiction);
    read_string(j, "medical_summary", info.medical_summary);
    read_string(j, "employment_history", info.employment_history);
    read_string(j, "earnings_history", info.earnings_history);
    read_string(j, "pre_injury_capacity", info.pre_injury_capacity);
    read_string(j, "post_injury_capacity", info.post_injury_capacity);
    read_string(j, "functional_limitations", info.functional_limitations);

    std::string case_type;
    read_string(j, "case_type", case_type);
    if (!case_type.empty()) {
        info.case_type = case_type_from_string(case_type);
    }
    return info;
}

EarningsParams parse_earnings(const json& j, CaseType case_type) {
    EarningsParams p;
    read_number(j, "base_earnings", p.base_earnings);
    read_number(j, "residual_earnings", p.residual_earnings);
    read_number(j, "wle", p.wle);
    read_number(j, "wage_growth", p.wage_growth);
    read_number(j, "discount_rate", p.discount_rate);
    read_bool(j, "enable_fringe_benefits", p.enable_fringe_benefits);
    read_number(j, "fringe_rate", p.fringe_rate);
    read_number(j, "pension", p.pension);
    read_number(j, "health_welfare", p.health_welfare);
    read_number(j, "annuity", p.annuity);
    read_number(j, "clothing_allowance", p.clothing_allowance);
    read_number(j, "other_benefits", p.other_benefits);
    read_number(j, "unemployment_rate", p.unemployment_rate);
    read_number(j, "ui_replacement_rate", p.ui_replacement_rate);
    read_number(j, "fed_tax_rate", p.fed_tax_rate);
    read_number(j, "state_tax_rate", p.state_tax_rate);
    read_bool(j, "enable_present_value", p.enable_present_value);

    // Era rates default to the single wage growth rate
    p.era1_wage_growth = p.wage_growth;
    p.era2_wage_growth = p.wage_growth;
    read_bool(j, "use_era_split", p.use_era_split);
    read_int(j, "era_split_year", p.era_split_year);
    read_number(j, "era1_wage_growth", p.era1_wage_growth);
    read_number(j, "era2_wage_growth", p.era2_wage_growth);

    p.is_wrongful_death = case_type == CaseType::WrongfulDeath;
    read_bool(j, "is_wrongful_death", p.is_wrongful_death);
    read_number(j, "era1_personal_consumption", p.era1_personal_consumption);
    read_number(j, "era2_personal_consumption", p.era2_personal_consumption);

    read_bool(j, "enable_pji", p.enable_pji);
    read_number(j, "pji_age", p.pji_age);
    read_string(j, "selected_scenario", p.selected_scenario);
    return p;
}

HhServices parse_household(const json& j) {
    HhServices h;
    read_bool(j, "active", h.active);
    read_number(j, "hours_per_week", h.hours_per_week);
    read_number(j, "hourly_rate", h.hourly_rate);
    read_number(j, "growth_rate", h.growth_rate);
    read_number(j, "discount_rate", h.discount_rate);
    return h;
}

LcpFrequency parse_frequency(const json& j, const std::string& item_name) {
    std::string name = "annual";
    read_string(j, "frequency", name);

    if (name == "annual") {
        return AnnualFrequency{};
    }
    if (name == "onetime") {
        return OneTimeFrequency{};
    }
    if (name == "recurring") {
        int interval = 1;
        read_int(j, "interval", interval);
        return RecurringFrequency{interval};
    }
    if (name == "custom") {
        CustomYearsFrequency custom;
        if (j.contains("custom_years")) {
            for (const auto& year : j["custom_years"]) {
                if (!year.is_number()) {
                    throw CaseParseError("Custom years for life care plan item '" +
                                         item_name + "' must be numbers");
                }
                const int plan_year = to_int(year.get<double>(), "Custom year");
                if (plan_year > MAX_PLAN_YEAR) {
                    throw CaseParseError("Custom year " + std::to_string(plan_year) +
                                         " exceeds " + std::to_string(MAX_PLAN_YEAR) +
                                         " plan years");
                }
                custom.years.push_back(plan_year);
            }
        }
        return custom;
    }
    throw CaseParseError("Unknown frequency '" + name + "' for life care plan item '" +
                         item_name + "'");
}

LcpItem parse_lcp_item(const json& j, int index) {
    if (!j.is_object()) {
        throw CaseParseError("Life care plan entries must be objects");
    }
    LcpItem item;
    item.id = index + 1;
    read_int(j, "id", item.id);
    read_string(j, "category", item.category_id);
    read_string(j, "name", item.name);
    read_number(j, "base_cost", item.base_cost);
    read_plan_year(j, "duration", item.duration);
    read_plan_year(j, "start_year", item.start_year);
    read_plan_year(j, "end_year", item.end_year);
    if (j.contains("cpi") && !j["cpi"].is_null()) {
        double cpi = 0.0;
        read_number(j, "cpi", cpi);
        item.cpi = cpi;
    }
    item.frequency = parse_frequency(j, item.name);
    return item;
}

PastActuals parse_past_actuals(const json& j) {
    if (!j.is_object()) {
        throw CaseParseError("Section 'past_actuals' must be an object");
    }
    PastActuals actuals;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto year = parse_number(it.key());
        if (!year) {
            throw CaseParseError("Past actuals key '" + it.key() + "' is not a year");
        }
        const json& value = it.value();
        const int key = to_int(*year, "Past actuals year '" + it.key() + "'");
        actuals[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return actuals;
}

} // anonymous namespace

ValuationInputs parse_case_from_string(const std::string& json_string) {
    ValuationInputs inputs;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw CaseParseError("Case file must contain a JSON object");
        }

        inputs.case_info = parse_case_info(require_object(j, "case"));
        inputs.earnings = parse_earnings(require_object(j, "earnings"), inputs.case_info.case_type);

        if (j.contains("household")) {
            inputs.household = parse_household(require_object(j, "household"));
        }

        if (j.contains("life_care_plan")) {
            if (!j["life_care_plan"].is_array()) {
                throw CaseParseError("Section 'life_care_plan' must be an array");
            }
            int index = 0;
            for (const auto& item_json : j["life_care_plan"]) {
                inputs.lcp_items.push_back(parse_lcp_item(item_json, index++));
            }
        }

        if (j.contains("past_actuals")) {
            inputs.past_actuals = parse_past_actuals(j["past_actuals"]);
        }

        read_bool(j, "union_mode", inputs.union_mode);

        if (j.contains("excluded_scenarios")) {
            for (const auto& id : j["excluded_scenarios"]) {
                inputs.excluded_scenarios.insert(id.get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw CaseParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw CaseParseError(std::string("JSON type error: ") + e.what());
    }

    return inputs;
}

ValuationInputs parse_case_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw CaseParseError("Failed to open case file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_case_from_string(buffer.str());
}

} // namespace io
} // namespace damagecalc
