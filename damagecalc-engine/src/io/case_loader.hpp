#ifndef DAMAGECALC_IO_CASE_LOADER_HPP
#define DAMAGECALC_IO_CASE_LOADER_HPP

#include "../valuation.hpp"
#include <stdexcept>
#include <string>

namespace damagecalc {
namespace io {

/**
 * @brief Exception thrown when a case file cannot be parsed
 */
class CaseParseError : public std::runtime_error {
public:
    explicit CaseParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a case from a JSON string
 *
 * Sections: "case" and "earnings" (required), "household",
 * "life_care_plan" (array), "past_actuals" (year -> amount),
 * "union_mode", "excluded_scenarios". Numeric fields accept numbers or
 * numeric strings; absent fields keep their defaults.
 *
 * @throws CaseParseError if the JSON is invalid or a section has the wrong shape
 */
ValuationInputs parse_case_from_string(const std::string& json_string);

/**
 * @brief Parses a case from a JSON file
 *
 * @throws CaseParseError if the file cannot be read or parsed
 */
ValuationInputs parse_case_from_file(const std::string& file_path);

} // namespace io
} // namespace damagecalc

#endif // DAMAGECALC_IO_CASE_LOADER_HPP
