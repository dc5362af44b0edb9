#include "json_writer.hpp"
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace damagecalc {
namespace io {

namespace {

// Tracks indentation and comma placement for one nesting level at a time
class JsonEmitter {
public:
    JsonEmitter(std::ostream& os, bool pretty)
        : os_(os), pretty_(pretty), depth_(0), first_(true) {}

    void begin_object(const char* key = nullptr) { open(key, '{'); }
    void end_object() { close('}'); }
    void begin_array(const char* key = nullptr) { open(key, '['); }
    void end_array() { close(']'); }

    void field(const char* key, double value) {
        prefix(key);
        os_ << value;
    }

    void field(const char* key, int value) {
        prefix(key);
        os_ << value;
    }

    void field(const char* key, bool value) {
        prefix(key);
        os_ << (value ? "true" : "false");
    }

    void field(const char* key, const std::string& value) {
        prefix(key);
        os_ << '"' << escape_json(value) << '"';
    }

    void value(const std::string& text) { field(nullptr, text); }

    void finish() {
        if (pretty_) {
            os_ << "\n";
        }
    }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_;

    void newline() {
        if (pretty_) {
            os_ << "\n" << std::string(static_cast<size_t>(depth_) * 2, ' ');
        }
    }

    void prefix(const char* key) {
        if (!first_) {
            os_ << ",";
        }
        first_ = false;
        if (depth_ > 0) {
            newline();
        }
        if (key != nullptr) {
            os_ << '"' << key << "\":" << (pretty_ ? " " : "");
        }
    }

    void open(const char* key, char bracket) {
        prefix(key);
        os_ << bracket;
        ++depth_;
        first_ = true;
    }

    void close(char bracket) {
        --depth_;
        if (!first_) {
            newline();
        }
        os_ << bracket;
        first_ = false;
    }
};

void write_algebraic(JsonEmitter& out, const Algebraic& a) {
    out.begin_object("algebraic");
    out.field("yfs", a.yfs);
    out.field("wlf", a.wlf);
    out.field("unemployment_factor", a.unemployment_factor);
    out.field("fringe_factor", a.fringe_factor);
    out.field("flat_fringe_amount", a.flat_fringe_amount);
    out.field("combined_tax_rate", a.combined_tax_rate);
    out.field("after_tax_factor", a.after_tax_factor);
    out.field("worklife_adjusted_base", a.worklife_adjusted_base);
    out.field("unemployment_adjusted_base", a.unemployment_adjusted_base);
    out.field("gross_compensation_with_fringes", a.gross_compensation_with_fringes);
    out.field("tax_on_base_earnings", a.tax_on_base_earnings);
    out.field("after_tax_compensation", a.after_tax_compensation);
    out.field("era1_personal_consumption", a.era1_personal_consumption);
    out.field("era2_personal_consumption", a.era2_personal_consumption);
    out.field("era1_aif", a.era1_aif);
    out.field("era2_aif", a.era2_aif);
    out.field("full_multiplier", a.full_multiplier);
    out.field("realized_multiplier", a.realized_multiplier);
    out.end_object();
}

void write_projection(JsonEmitter& out, const Projection& p) {
    out.begin_object("projection");
    out.field("total_past_loss", p.total_past_loss);
    out.field("total_future_nominal", p.total_future_nominal);
    out.field("total_future_pv", p.total_future_pv);

    out.begin_array("past_schedule");
    for (const auto& row : p.past_schedule) {
        out.begin_object();
        out.field("year", row.year);
        out.field("label", row.label);
        out.field("fraction", row.fraction);
        out.field("gross_base", row.gross_base);
        out.field("gross_actual", row.gross_actual);
        out.field("net_loss", row.net_loss);
        out.field("is_manual", row.is_manual);
        out.end_object();
    }
    out.end_array();

    out.begin_array("future_schedule");
    for (const auto& row : p.future_schedule) {
        out.begin_object();
        out.field("year", row.year);
        out.field("calendar_year", row.calendar_year);
        out.field("gross", row.gross);
        out.field("net_loss", row.net_loss);
        out.field("discount_factor", row.discount_factor);
        out.field("pv", row.pv);
        out.end_object();
    }
    out.end_array();

    out.end_object();
}

void write_life_care_plan(JsonEmitter& out, const LcpData& lcp) {
    out.begin_object("life_care_plan");
    out.field("total_nom", lcp.total_nom);
    out.field("total_pv", lcp.total_pv);
    out.begin_array("items");
    for (const auto& value : lcp.items) {
        out.begin_object();
        out.field("id", value.item.id);
        out.field("name", value.item.name);
        out.field("category", value.item.category_id);
        out.field("frequency", frequency_name(value.item.frequency));
        out.field("base_cost", value.item.base_cost);
        out.field("cpi_rate", value.cpi_rate);
        out.field("total_nom", value.total_nom);
        out.field("total_pv", value.total_pv);
        out.end_object();
    }
    out.end_array();
    out.end_object();
}

void write_scenarios(JsonEmitter& out, const std::vector<ScenarioProjection>& scenarios) {
    out.begin_array("scenarios");
    for (const auto& s : scenarios) {
        out.begin_object();
        out.field("id", s.id);
        out.field("label", s.label);
        out.field("retirement_age", s.retirement_age);
        out.field("yfs", s.yfs);
        out.field("wlf", s.wlf);
        out.field("wlf_percent", s.wlf_percent);
        out.field("total_past_loss", s.total_past_loss);
        out.field("total_future_pv", s.total_future_pv);
        out.field("total_earnings_loss", s.total_earnings_loss);
        out.field("grand_total", s.grand_total);
        out.field("included", s.included);
        out.end_object();
    }
    out.end_array();
}

void write_period_rows(JsonEmitter& out, const std::vector<PeriodRow>& rows) {
    out.begin_array("period_rows");
    for (const auto& row : rows) {
        out.begin_object();
        out.field("year_num", row.year_num);
        out.field("calendar_year", row.calendar_year);
        out.field("period_type", period_type_to_string(row.period_type));
        out.field("gross_income", row.gross_income);
        out.field("net_loss", row.net_loss);
        out.field("discount_factor", row.discount_factor);
        out.field("present_value", row.present_value);
        out.field("cumulative_pv", row.cumulative_pv);
        out.end_object();
    }
    out.end_array();
}

} // anonymous namespace

std::string escape_json(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                    escaped += buffer;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

void write_damages_report_json(std::ostream& os, const DamagesReport& report,
                               bool pretty_print) {
    os << std::fixed << std::setprecision(6);
    JsonEmitter out(os, pretty_print);

    out.begin_object();

    const ReportMetadata& meta = report.metadata;
    out.begin_object("metadata");
    out.field("calculation_method", meta.calculation_method);
    out.field("schema_version", meta.schema_version);
    out.field("valuation_date", meta.valuation_date);
    out.field("base_calendar_year", meta.base_calendar_year);
    out.field("case_type", meta.case_type);
    out.field("cpi_table_version", meta.cpi_table_version);
    out.field("active_scenario", meta.active_scenario);
    out.begin_array("included_scenarios");
    for (const auto& id : meta.included_scenarios) {
        out.value(id);
    }
    out.end_array();
    out.end_object();

    out.begin_object("date_calc");
    out.field("age_injury", report.date_calc.age_injury);
    out.field("age_trial", report.date_calc.age_trial);
    out.field("current_age", report.date_calc.current_age);
    out.field("past_years", report.date_calc.past_years);
    out.field("derived_yfs", report.date_calc.derived_yfs);
    out.end_object();

    out.field("work_life_factor", report.work_life_factor);

    const SummaryMetrics& m = report.summary;
    out.begin_object("summary");
    out.field("total_past_loss", m.total_past_loss);
    out.field("total_future_pv", m.total_future_pv);
    out.field("total_earnings_loss", m.total_earnings_loss);
    out.field("household_pv", m.household_pv);
    out.field("lcp_pv", m.lcp_pv);
    out.field("grand_total", m.grand_total);
    out.end_object();

    write_algebraic(out, report.algebraic);
    write_projection(out, report.projection);

    out.begin_object("household_services");
    out.field("total_nom", report.household_data.total_nom);
    out.field("total_pv", report.household_data.total_pv);
    out.end_object();

    write_life_care_plan(out, report.lcp_data);
    write_scenarios(out, report.scenarios);
    write_period_rows(out, report.period_rows);

    out.field("grand_total", report.grand_total);

    out.end_object();
    out.finish();
}

void write_damages_report_json(const std::string& filepath, const DamagesReport& report,
                               bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_damages_report_json(file, report, pretty_print);
}

} // namespace io
} // namespace damagecalc
