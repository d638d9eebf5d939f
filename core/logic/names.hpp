// ==============================================================================
// Name Table
// ==============================================================================
// Interns identifier and keyword strings to small integer ids. One table is
// owned by the simulation driver and passed by reference to the scanner,
// parser, devices and monitors.
// ==============================================================================

#ifndef LOGSIM_LOGIC_NAMES_HPP
#define LOGSIM_LOGIC_NAMES_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace logsim {

class NameTable {
public:
    /**
     * @brief Return the ids of the given strings, interning any new ones
     *
     * The same string always yields the same id for the lifetime of the table.
     */
    std::vector<NameId> lookup(const std::vector<std::string>& names);

    // Single-string form of lookup()
    NameId lookup(const std::string& name);

    // Id of a string that is already interned, without allocating one
    std::optional<NameId> query(const std::string& name) const;

    /**
     * @brief Text of an interned id
     *
     * @throws UnknownIdError if the id was never allocated
     */
    const std::string& get_text(NameId id) const;

    size_t size() const { return names_.size(); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, NameId> ids_;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_NAMES_HPP
