#include "cpi_table_loader.hpp"
#include "csv_reader.hpp"
#include "../numeric.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace damagecalc {
namespace io {

namespace {

const std::string VERSION_PREFIX = "# version:";

} // anonymous namespace

CpiCategoryTable load_cpi_table_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open CPI table file: " + filepath);
    }
    return load_cpi_table_csv(file);
}

CpiCategoryTable load_cpi_table_csv(std::istream& is) {
    // Version comment must precede the header
    std::string version = CpiCategoryTable::DEFAULT_VERSION;
    std::string first_line;
    while (is.peek() == '#' && std::getline(is, first_line)) {
        if (first_line.compare(0, VERSION_PREFIX.size(), VERSION_PREFIX) == 0) {
            std::istringstream value(first_line.substr(VERSION_PREFIX.size()));
            value >> version;
        }
    }

    CpiCategoryTable table(version);
    for (const auto& category : CpiCategoryTable::default_table().categories()) {
        table.set(category.id, category.label, category.rate);
    }

    CsvReader reader(is);

    // Skip header row, past any blank lines before it
    while (reader.has_more() && reader.read_row().empty()) {
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 3) {
            throw std::runtime_error("CPI table CSV requires columns: id,label,rate (got " +
                                     std::to_string(row.size()) + ")");
        }

        const auto rate = parse_number(row[2]);
        if (!rate) {
            throw std::runtime_error("Invalid CPI rate '" + row[2] + "' for category " + row[0]);
        }
        table.set(row[0], row[1], *rate);
    }

    return table;
}

} // namespace io
} // namespace damagecalc
