#include "import/import_source.hpp"

#include <cmath>
#include <sstream>

namespace tally::importer {

MemorySource& MemorySource::set_group(RecordGroup group, Rows rows) {
    groups_[group] = std::move(rows);
    return *this;
}

Result<std::optional<Rows>, Error> MemorySource::group(RecordGroup group) {
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return Result<std::optional<Rows>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Rows>, Error>::ok(it->second);
}

std::string to_display(const FieldValue& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return ""; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
                return std::to_string(static_cast<int64_t>(d));
            }
            std::ostringstream oss;
            oss << d;
            return oss.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, value);
}

} // namespace tally::importer
