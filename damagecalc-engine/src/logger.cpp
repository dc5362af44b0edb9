/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "io/json_writer.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace damagecalc {

namespace {

std::string money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    file_stream_.reset();
    config_ = config;

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_case_loaded(const CaseContext& ctx, const ValuationInputs& inputs) {
    std::map<std::string, std::string> fields;
    fields["event"] = "case_loaded";
    add_context(ctx, fields);
    fields["case_type"] = case_type_to_string(inputs.case_info.case_type);
    fields["date_of_injury"] = inputs.case_info.date_of_injury;
    fields["date_of_trial"] = inputs.case_info.date_of_trial;
    fields["base_earnings"] = money(inputs.earnings.base_earnings);
    fields["union_mode"] = inputs.union_mode ? "true" : "false";
    fields["household_active"] = inputs.household.active ? "true" : "false";
    fields["lcp_items"] = std::to_string(inputs.lcp_items.size());
    fields["past_actuals"] = std::to_string(inputs.past_actuals.size());

    log(LogLevel::INFO, "Case loaded", std::move(fields));
}

void Logger::log_valuation_complete(
    const CaseContext& ctx,
    const DamagesReport& report,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "valuation_complete";
    add_context(ctx, fields);
    fields["age_injury"] = report.date_calc.age_injury;
    fields["derived_yfs"] = std::to_string(report.date_calc.derived_yfs);
    fields["work_life_factor"] = std::to_string(report.work_life_factor);
    fields["full_multiplier"] = std::to_string(report.algebraic.full_multiplier);
    fields["total_past_loss"] = money(report.summary.total_past_loss);
    fields["total_future_pv"] = money(report.summary.total_future_pv);
    fields["household_pv"] = money(report.summary.household_pv);
    fields["lcp_pv"] = money(report.summary.lcp_pv);
    fields["grand_total"] = money(report.grand_total);
    fields["scenario_count"] = std::to_string(report.scenarios.size());
    fields["past_rows"] = std::to_string(report.projection.past_schedule.size());
    fields["future_rows"] = std::to_string(report.projection.future_schedule.size());
    fields["execution_time_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Valuation complete", std::move(fields));
}

void Logger::log_scenario_summary(const CaseContext& ctx, const ScenarioProjection& scenario) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_summary";
    add_context(ctx, fields);
    fields["scenario_id"] = scenario.id;
    fields["label"] = scenario.label;
    fields["yfs"] = std::to_string(scenario.yfs);
    fields["wlf_percent"] = std::to_string(scenario.wlf_percent);
    fields["total_earnings_loss"] = money(scenario.total_earnings_loss);
    fields["grand_total"] = money(scenario.grand_total);
    fields["included"] = scenario.included ? "true" : "false";

    log(LogLevel::DEBUG, "Scenario " + scenario.label, std::move(fields));
}

void Logger::log_output_written(
    const CaseContext& ctx,
    const std::string& kind,
    const std::string& path,
    size_t rows
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    add_context(ctx, fields);
    fields["format"] = kind;
    fields["path"] = path;
    if (rows > 0) {
        fields["rows"] = std::to_string(rows);
    }

    log(LogLevel::INFO, "Output written", std::move(fields));
}

void Logger::log_warning(const CaseContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(ctx, fields);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const CaseContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(ctx, fields);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Damages calculation failed", std::move(fields));
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context(const CaseContext& ctx, std::map<std::string, std::string>& fields) const {
    if (!ctx.case_file.empty()) {
        fields["case_file"] = ctx.case_file;
    }
    if (!ctx.plaintiff.empty()) {
        fields["plaintiff"] = ctx.plaintiff;
    }
    if (!ctx.file_number.empty()) {
        fields["file_number"] = ctx.file_number;
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << io::escape_json(key) << "\":\"" << io::escape_json(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace damagecalc
