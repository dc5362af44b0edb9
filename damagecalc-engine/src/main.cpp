#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "valuation.hpp"
#include "schedule.hpp"
#include "numeric.hpp"
#include "logger.hpp"
#include "io/case_loader.hpp"
#include "io/cpi_table_loader.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string case_path;
    std::string cpi_table_path;
    std::string valuation_date;          // Empty = today
    int base_year = 0;                   // 0 = trial year, else valuation year
    std::string output_path;
    std::string schedule_parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "DamageCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --case <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --case <path>               JSON case file (required)\n";
    std::cerr << "  --cpi-table <path>          CSV of CPI categories (id,label,rate)\n";
    std::cerr << "                              layered over the built-in table\n\n";
    std::cerr << "Valuation options:\n";
    std::cerr << "  --valuation-date <date>     Date used for the current age\n";
    std::cerr << "                              (M/D/YYYY or YYYY-MM-DD, default: today)\n";
    std::cerr << "  --base-year <year>          First calendar year of detailed schedules\n";
    std::cerr << "                              (default: trial year, else valuation year)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON report file (default: stdout)\n";
    std::cerr << "  --schedule-parquet <path>   Parquet export of the detailed earnings\n";
    std::cerr << "                              schedule of each included scenario\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log events to a file\n";
    std::cerr << "  --log-text                  Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --case data/sample_case.json \\\n";
    std::cerr << "      --cpi-table data/cpi_categories.csv \\\n";
    std::cerr << "      --valuation-date 2025-01-01 \\\n";
    std::cerr << "      --output report.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--case" && i + 1 < argc) {
            args.case_path = argv[++i];
        } else if (arg == "--cpi-table" && i + 1 < argc) {
            args.cpi_table_path = argv[++i];
        } else if (arg == "--valuation-date" && i + 1 < argc) {
            args.valuation_date = argv[++i];
        } else if (arg == "--base-year" && i + 1 < argc) {
            const auto year = damagecalc::parse_number(argv[++i]);
            if (!year) {
                std::cerr << "Error: --base-year must be a number\n\n";
                return false;
            }
            if (*year < 1 || *year > 9999) {
                std::cerr << "Error: --base-year must be between 1 and 9999\n\n";
                return false;
            }
            args.base_year = static_cast<int>(*year);
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--schedule-parquet" && i + 1 < argc) {
            args.schedule_parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = to_upper(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.case_path.empty()) {
        std::cerr << "Error: --case is required\n";
        valid = false;
    } else if (!file_exists(args.case_path)) {
        std::cerr << "Error: Case file not found: " << args.case_path << "\n";
        valid = false;
    }

    if (!args.cpi_table_path.empty() && !file_exists(args.cpi_table_path)) {
        std::cerr << "Error: CPI table file not found: " << args.cpi_table_path << "\n";
        valid = false;
    }

    if (!args.valuation_date.empty() && !damagecalc::parse_date(args.valuation_date)) {
        std::cerr << "Error: --valuation-date is not a valid date: " << args.valuation_date << "\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

damagecalc::CalendarDate today() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    return damagecalc::CalendarDate{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
}

void print_summary(const damagecalc::DamagesReport& report) {
    const auto& m = report.summary;
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "\nResults:\n";
    std::cerr << "  Age at injury:     " << report.date_calc.age_injury << "\n";
    std::cerr << "  YFS:               " << report.date_calc.derived_yfs << "\n";
    std::cerr << "  Work-life factor:  " << report.work_life_factor << "%\n";
    std::cerr << "  Past loss:         " << m.total_past_loss << "\n";
    std::cerr << "  Future loss (PV):  " << m.total_future_pv << "\n";
    std::cerr << "  Household (PV):    " << m.household_pv << "\n";
    std::cerr << "  Life care (PV):    " << m.lcp_pv << "\n";
    std::cerr << "  Grand total:       " << report.grand_total << "\n";

    if (!report.scenarios.empty()) {
        std::cerr << "\nScenarios:\n";
        for (const auto& s : report.scenarios) {
            std::cerr << "  " << std::left << std::setw(18) << s.label << std::right
                      << s.grand_total << (s.included ? "" : "  (excluded)") << "\n";
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\n";
        print_usage(argv[0]);
        return 1;
    }

    damagecalc::LoggerConfig log_config;
    log_config.min_level = damagecalc::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    damagecalc::Logger& logger = damagecalc::Logger::get_instance();
    logger.configure(log_config);

    damagecalc::CaseContext ctx;
    ctx.case_file = args.case_path;

    try {
        damagecalc::ValuationInputs inputs = damagecalc::io::parse_case_from_file(args.case_path);
        ctx = damagecalc::CaseContext(args.case_path, inputs.case_info);
        logger.log_case_loaded(ctx, inputs);

        damagecalc::ValuationConfig config(args.valuation_date.empty()
            ? today()
            : *damagecalc::parse_date(args.valuation_date));
        config.base_calendar_year = args.base_year;
        if (!args.cpi_table_path.empty()) {
            config.cpi_table = damagecalc::io::load_cpi_table_csv(args.cpi_table_path);
        }

        for (const auto& warning : damagecalc::collect_input_warnings(inputs, config.cpi_table)) {
            logger.log_warning(ctx, warning);
        }

        auto start = std::chrono::steady_clock::now();
        damagecalc::DamagesReport report = damagecalc::run_valuation(inputs, config);
        auto end = std::chrono::steady_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

        for (const auto& scenario : report.scenarios) {
            logger.log_scenario_summary(ctx, scenario);
        }
        if (report.date_calc.derived_yfs <= 0.0) {
            logger.log_warning(ctx, "Birth, injury or trial date missing; earnings loss is zero");
        }
        logger.log_valuation_complete(ctx, report, elapsed_ms);

        print_summary(report);

        if (args.output_path.empty()) {
            damagecalc::io::write_damages_report_json(std::cout, report);
        } else {
            damagecalc::io::write_damages_report_json(args.output_path, report);
            logger.log_output_written(ctx, "json", args.output_path);
        }

        if (!args.schedule_parquet_path.empty()) {
            std::vector<damagecalc::ScenarioSchedule> schedules;
            size_t rows = 0;
            for (const auto& scenario : report.scenarios) {
                if (!scenario.included) {
                    continue;
                }
                damagecalc::ScenarioSchedule schedule;
                schedule.scenario_id = scenario.id;
                schedule.rows = damagecalc::compute_detailed_scenario_schedule(
                    inputs.case_info, inputs.earnings, report.date_calc,
                    scenario.retirement_age, inputs.union_mode,
                    report.metadata.base_calendar_year);
                rows += schedule.rows.size();
                schedules.push_back(std::move(schedule));
            }
            damagecalc::ParquetWriter::write_schedules(schedules, args.schedule_parquet_path);
            logger.log_output_written(ctx, "parquet", args.schedule_parquet_path, rows);
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
