#ifndef DAMAGECALC_IO_CSV_READER_HPP
#define DAMAGECALC_IO_CSV_READER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <istream>

namespace damagecalc {
namespace io {

// Line-oriented CSV reader. Cells are trimmed; a cell wrapped in double
// quotes may contain the delimiter, and "" inside it is a literal quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next row, empty at end of input. Blank lines and lines starting
    // with '#' come back as empty rows.
    std::vector<std::string> read_row();
    bool has_more() const;

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace damagecalc

#endif // DAMAGECALC_IO_CSV_READER_HPP
