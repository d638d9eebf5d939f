// ==============================================================================
// Circuit Diagnostics
// ==============================================================================
// Problems found while reading a circuit file. The parser keeps going after
// an error, so one run can produce many of these; each carries enough
// context (position, offending source line, device/pin names) to be shown
// as-is in a terminal or a GUI.
// ==============================================================================

#ifndef LOGSIM_LOGIC_DIAGNOSTICS_HPP
#define LOGSIM_LOGIC_DIAGNOSTICS_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "types.hpp"
#include "error.hpp"

namespace logsim {

enum class Severity {
    WARNING,
    ERROR
};

/**
 * @brief What exactly went wrong
 *
 * Lexical and syntax problems share a few broad codes; semantic problems
 * each get their own so callers (and tests) can tell them apart.
 */
enum class DiagnosticCode {
    // Lexical
    INVALID_CHARACTER,
    UNTERMINATED_COMMENT,

    // Syntax
    UNEXPECTED_SYMBOL,
    UNEXPECTED_END_OF_FILE,
    INVALID_DEVICE_NAME,
    INVALID_PIN_NAME,
    MISSING_DEVICES,

    // Semantic
    DUPLICATE_DEVICE,
    UNDEFINED_DEVICE,
    INVALID_PIN,
    INPUT_ALREADY_CONNECTED,
    INVALID_ARGUMENT,
    DUPLICATE_MONITOR       // the only warning
};

const char* diagnostic_code_to_string(DiagnosticCode code);

struct SourceLocation {
    std::string file;
    LineNumber line = 0;
    ColumnNumber column = 0;
};

struct Diagnostic {
    Severity severity = Severity::ERROR;
    ErrorCategory category = ErrorCategory::SYNTAX_ERROR;
    DiagnosticCode code = DiagnosticCode::UNEXPECTED_SYMBOL;
    std::string message;
    SourceLocation location;
    std::string source_line;    // text of the offending line, for the caret display
};

class Diagnostics {
public:
    void add(Diagnostic diagnostic);

    bool has_errors() const;
    size_t error_count() const;
    size_t warning_count() const;

    // Number of diagnostics with this code
    size_t count(DiagnosticCode code) const;

    const std::vector<Diagnostic>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    /**
     * @brief Print every diagnostic
     *
     * Format:
     *   adder.def:3:12: error: Semantic Error - Device sw3 is not defined [undefined-device]
     *       sw3 > and1.I1,
     *       ^
     */
    void render_to(std::ostream& os) const;

private:
    std::vector<Diagnostic> items_;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_DIAGNOSTICS_HPP
