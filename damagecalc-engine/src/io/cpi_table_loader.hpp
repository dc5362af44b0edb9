#ifndef DAMAGECALC_IO_CPI_TABLE_LOADER_HPP
#define DAMAGECALC_IO_CPI_TABLE_LOADER_HPP

#include "../cpi_table.hpp"
#include <istream>
#include <string>

namespace damagecalc {
namespace io {

// Load CPI categories from CSV with header "id,label,rate" (rate in
// percent). Rows are layered over the built-in default table, so a file
// only needs the categories it changes. A "# version: X" line sets the
// table version.
// @throws std::runtime_error if the file cannot be opened or a row is malformed
CpiCategoryTable load_cpi_table_csv(const std::string& filepath);
CpiCategoryTable load_cpi_table_csv(std::istream& is);

} // namespace io
} // namespace damagecalc

#endif // DAMAGECALC_IO_CPI_TABLE_LOADER_HPP
