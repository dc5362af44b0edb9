#include "cpi_table.hpp"
#include <algorithm>
#include <utility>

namespace damagecalc {

bool CpiCategory::operator==(const CpiCategory& other) const {
    return id == other.id && label == other.label && rate == other.rate;
}

// ============================================================================
// CpiCategoryTable Implementation
// ============================================================================

CpiCategoryTable::CpiCategoryTable() : version_(DEFAULT_VERSION) {}

CpiCategoryTable::CpiCategoryTable(std::string version) : version_(std::move(version)) {}

CpiCategoryTable CpiCategoryTable::default_table() {
    CpiCategoryTable table;
    table.set("evals", "Physician Evals & Home Care", 2.88);
    table.set("rx", "Rx / Medical Commodities", 1.65);
    table.set("surgery", "Hospital/Surgical Services", 4.07);
    table.set("therapy", "Therapy & Treatments", 1.62);
    table.set("transport", "Transportation", 4.32);
    table.set("home", "Home Modifications", 4.16);
    table.set("educ", "Education/Training", 2.61);
    table.set("custom", "Custom Rate", 0.00);
    return table;
}

void CpiCategoryTable::set(const std::string& id, const std::string& label, double rate) {
    auto it = std::find_if(categories_.begin(), categories_.end(),
                           [&id](const CpiCategory& c) { return c.id == id; });
    if (it != categories_.end()) {
        it->label = label;
        it->rate = rate;
        return;
    }
    categories_.push_back(CpiCategory{id, label, rate});
}

std::optional<double> CpiCategoryTable::find_rate(const std::string& id) const {
    for (const auto& c : categories_) {
        if (c.id == id) {
            return c.rate;
        }
    }
    return std::nullopt;
}

double CpiCategoryTable::get_rate(const std::string& id) const {
    return find_rate(id).value_or(0.0);
}

bool CpiCategoryTable::contains(const std::string& id) const {
    return find_rate(id).has_value();
}

} // namespace damagecalc
