// ==============================================================================
// Common Type Definitions
// ==============================================================================
// This file defines basic types used throughout the logic simulator.
// Using explicit types makes the code more readable and helps catch bugs.
// ==============================================================================

#ifndef LOGSIM_COMMON_TYPES_HPP
#define LOGSIM_COMMON_TYPES_HPP

#include <cstddef>      // For size_t
#include <string>       // For std::string
#include <vector>       // For std::vector
#include <optional>     // For std::optional (values that might not exist)

namespace logsim {

// ==============================================================================
// Names
// ==============================================================================

/**
 * @brief Interned name id
 *
 * Every identifier and keyword in a circuit file is interned by the NameTable
 * and from then on referred to by this small integer. Device ids and pin ids
 * are both NameIds.
 */
using NameId = size_t;

/**
 * @brief An output pin reference that may be the unnamed default output
 *
 * Gates, switches, clocks, RC and SIGGEN devices have a single unnamed
 * output (std::nullopt). DTYPE devices have the named outputs Q and QBAR.
 */
using OptionalPin = std::optional<NameId>;

// ==============================================================================
// Logic Types
// ==============================================================================

/**
 * @brief Logic signal value
 *
 * Each wire carries one of two values:
 * - LOW (false, 0)
 * - HIGH (true, 1)
 */
enum class Signal {
    LOW = 0,
    HIGH = 1
};

/**
 * @brief The closed set of device kinds the circuit language supports
 */
enum class DeviceKind {
    SWITCH,
    CLOCK,
    AND,
    OR,
    NAND,
    NOR,
    XOR,
    DTYPE,
    RC,
    SIGGEN
};

// ==============================================================================
// Limits
// ==============================================================================

// Largest input count an AND/OR/NAND/NOR gate may be declared with
constexpr size_t kMaxGateInputs = 16;

// Combinational settle cap: kSettlePassesPerDevice * devices + kSettleBasePasses
constexpr size_t kSettlePassesPerDevice = 2;
constexpr size_t kSettleBasePasses = 20;

// ==============================================================================
// Utility Type Aliases
// ==============================================================================

/**
 * @brief Source code line number (1-based, 0 = unknown)
 */
using LineNumber = size_t;

/**
 * @brief Source code column number (1-based, 0 = unknown)
 */
using ColumnNumber = size_t;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Convert a Signal to bool
 *
 * Makes it easy to use Signal values in conditions:
 * if (to_bool(signal)) { ... }
 */
inline bool to_bool(Signal s) {
    return s == Signal::HIGH;
}

/**
 * @brief Convert bool to Signal
 */
inline Signal to_signal(bool b) {
    return b ? Signal::HIGH : Signal::LOW;
}

/**
 * @brief Logical inverse of a Signal
 */
inline Signal invert(Signal s) {
    return s == Signal::HIGH ? Signal::LOW : Signal::HIGH;
}

/**
 * @brief Convert DeviceKind to its keyword in the circuit language
 *
 * @param kind The device kind
 * @return Keyword text (e.g., "AND", "DTYPE")
 */
const char* device_kind_to_string(DeviceKind kind);

/**
 * @brief Look up a device kind by its keyword
 *
 * @param keyword Keyword text as written in a circuit file
 * @return The kind, or std::nullopt if the keyword is not a device kind
 */
std::optional<DeviceKind> device_kind_from_string(const std::string& keyword);

/**
 * @brief True for the kinds declared with an input count (AND, OR, NAND, NOR)
 */
bool is_multi_input_gate(DeviceKind kind);

/**
 * @brief All device kinds, in declaration order
 */
const std::vector<DeviceKind>& all_device_kinds();

}  // namespace logsim

#endif  // LOGSIM_COMMON_TYPES_HPP
