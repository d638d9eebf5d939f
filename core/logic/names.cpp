// ==============================================================================
// Name Table Implementation
// ==============================================================================

#include "names.hpp"
#include "error.hpp"

namespace logsim {

std::vector<NameId> NameTable::lookup(const std::vector<std::string>& names) {
    std::vector<NameId> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(lookup(name));
    }
    return result;
}

NameId NameTable::lookup(const std::string& name) {
    auto it = ids_.find(name);
    if (it != ids_.end()) {
        return it->second;
    }
    NameId id = names_.size();
    names_.push_back(name);
    ids_.emplace(name, id);
    return id;
}

std::optional<NameId> NameTable::query(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const std::string& NameTable::get_text(NameId id) const {
    if (id >= names_.size()) {
        throw UnknownIdError(id);
    }
    return names_[id];
}

}  // namespace logsim
