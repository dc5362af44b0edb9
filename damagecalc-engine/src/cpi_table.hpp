#ifndef DAMAGECALC_CPI_TABLE_HPP
#define DAMAGECALC_CPI_TABLE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace damagecalc {

// One life care plan cost category and its annual inflation rate
struct CpiCategory {
    std::string id;
    std::string label;
    double rate;                    // Annual CPI growth in percent

    bool operator==(const CpiCategory& other) const;
};

// CpiCategoryTable: category id -> medical CPI inflation rate.
// Passed explicitly to the life care plan valuator; never mutated there.
class CpiCategoryTable {
public:
    static constexpr const char* DEFAULT_VERSION = "2024.1";

    CpiCategoryTable();
    explicit CpiCategoryTable(std::string version);

    // Built-in table of medical CPI categories
    static CpiCategoryTable default_table();

    // Add or replace a category
    void set(const std::string& id, const std::string& label, double rate);

    std::optional<double> find_rate(const std::string& id) const;

    // Rate for a category, 0 for unknown ids
    double get_rate(const std::string& id) const;

    bool contains(const std::string& id) const;

    const std::vector<CpiCategory>& categories() const { return categories_; }
    size_t size() const { return categories_.size(); }
    bool empty() const { return categories_.empty(); }
    const std::string& version() const { return version_; }

private:
    std::string version_;
    std::vector<CpiCategory> categories_;
};

} // namespace damagecalc

#endif // DAMAGECALC_CPI_TABLE_HPP
