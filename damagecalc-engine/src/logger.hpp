/**
 * @file logger.hpp
 * @brief Structured logging for the damages CLI with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Case context (case file, plaintiff, file number) on every event
 *
 * The calculation engine never logs; only the loader and CLI do.
 */

#ifndef DAMAGECALC_LOGGER_HPP
#define DAMAGECALC_LOGGER_HPP

#include "valuation.hpp"
#include <string>
#include <map>
#include <memory>
#include <fstream>

namespace damagecalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate factors and per-scenario detail
    INFO,    ///< Case loaded, valuation complete, output written
    WARN,    ///< Inputs the engine degraded (unparseable actuals, unknown categories)
    ERROR    ///< Failures that stop the run
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-sensitive, upper case)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Case identification attached to each event
 */
struct CaseContext {
    std::string case_file;           ///< Path the case was loaded from
    std::string plaintiff;
    std::string file_number;

    CaseContext() = default;
    CaseContext(const std::string& path, const CaseInfo& info)
        : case_file(path), plaintiff(info.plaintiff), file_number(info.file_number) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("damagecalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   CaseContext ctx(case_path, inputs.case_info);
 *   logger.log_case_loaded(ctx, inputs);
 *   logger.log_valuation_complete(ctx, report, elapsed_ms);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a parsed case file
     */
    void log_case_loaded(const CaseContext& ctx, const ValuationInputs& inputs);

    /**
     * @brief Log headline figures of a finished valuation
     *
     * @param elapsed_ms Wall time of run_valuation
     */
    void log_valuation_complete(
        const CaseContext& ctx,
        const DamagesReport& report,
        double elapsed_ms
    );

    /**
     * @brief Log one retirement age scenario (DEBUG)
     */
    void log_scenario_summary(const CaseContext& ctx, const ScenarioProjection& scenario);

    /**
     * @brief Log a report or export written to disk
     *
     * @param kind "json" or "parquet"
     * @param rows Rows written, 0 when not meaningful
     */
    void log_output_written(
        const CaseContext& ctx,
        const std::string& kind,
        const std::string& path,
        size_t rows = 0
    );

    void log_warning(const CaseContext& ctx, const std::string& warning_message);

    void log_error(const CaseContext& ctx, const std::string& error_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(const CaseContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace damagecalc

#endif // DAMAGECALC_LOGGER_HPP
