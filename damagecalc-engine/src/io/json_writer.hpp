#ifndef DAMAGECALC_IO_JSON_WRITER_HPP
#define DAMAGECALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../valuation.hpp"

namespace damagecalc {
namespace io {

// Write DamagesReport to JSON format.
// Monetary values and factors are raw numbers at fixed precision; formatting
// for display is left to the consumer.
void write_damages_report_json(std::ostream& os, const DamagesReport& report,
                               bool pretty_print = true);

// Write DamagesReport to JSON file
void write_damages_report_json(const std::string& filepath, const DamagesReport& report,
                               bool pretty_print = true);

// Escape a string for embedding in a JSON document (without quotes)
std::string escape_json(const std::string& text);

} // namespace io
} // namespace damagecalc

#endif // DAMAGECALC_IO_JSON_WRITER_HPP
