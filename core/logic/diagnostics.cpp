// ==============================================================================
// Circuit Diagnostics Implementation
// ==============================================================================

#include "diagnostics.hpp"
#include <ostream>
#include <string>
#include <utility>

namespace logsim {

namespace {

const char* severity_label(Severity severity) {
    switch (severity) {
        case Severity::WARNING: return "warning";
        case Severity::ERROR:   return "error";
    }
    return "error";
}

// Whitespace that lines a caret up under `column` of `line`. Tabs are
// kept so the caret lands where the terminal draws the character.
std::string caret_padding(const std::string& line, ColumnNumber column) {
    std::string padding;
    ColumnNumber current = 1;
    for (char c : line) {
        if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) continue;
        if (current >= column) break;
        padding += (c == '\t') ? '\t' : ' ';
        current++;
    }
    if (current < column) padding.append(column - current, ' ');
    return padding;
}

}  // namespace

const char* diagnostic_code_to_string(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::INVALID_CHARACTER:       return "invalid-character";
        case DiagnosticCode::UNTERMINATED_COMMENT:    return "unterminated-comment";
        case DiagnosticCode::UNEXPECTED_SYMBOL:       return "unexpected-symbol";
        case DiagnosticCode::UNEXPECTED_END_OF_FILE:  return "unexpected-end-of-file";
        case DiagnosticCode::INVALID_DEVICE_NAME:     return "invalid-device-name";
        case DiagnosticCode::INVALID_PIN_NAME:        return "invalid-pin-name";
        case DiagnosticCode::MISSING_DEVICES:         return "missing-devices";
        case DiagnosticCode::DUPLICATE_DEVICE:        return "duplicate-device";
        case DiagnosticCode::UNDEFINED_DEVICE:        return "undefined-device";
        case DiagnosticCode::INVALID_PIN:             return "invalid-pin";
        case DiagnosticCode::INPUT_ALREADY_CONNECTED: return "input-already-connected";
        case DiagnosticCode::INVALID_ARGUMENT:        return "invalid-argument";
        case DiagnosticCode::DUPLICATE_MONITOR:       return "duplicate-monitor";
        default:                                      return "unknown";
    }
}

void Diagnostics::add(Diagnostic diagnostic) {
    items_.push_back(std::move(diagnostic));
}

bool Diagnostics::has_errors() const {
    return error_count() > 0;
}

size_t Diagnostics::error_count() const {
    size_t n = 0;
    for (const auto& d : items_) {
        if (d.severity == Severity::ERROR) n++;
    }
    return n;
}

size_t Diagnostics::warning_count() const {
    return items_.size() - error_count();
}

size_t Diagnostics::count(DiagnosticCode code) const {
    size_t n = 0;
    for (const auto& d : items_) {
        if (d.code == code) n++;
    }
    return n;
}

void Diagnostics::render_to(std::ostream& os) const {
    for (const auto& d : items_) {
        const auto& loc = d.location;
        if (!loc.file.empty()) {
            os << loc.file << ":";
        }
        if (loc.line > 0) {
            os << loc.line << ":";
            if (loc.column > 0) {
                os << loc.column << ":";
            }
        }
        os << " " << severity_label(d.severity) << ": "
           << error_category_to_string(d.category) << " - " << d.message
           << " [" << diagnostic_code_to_string(d.code) << "]\n";

        if (!d.source_line.empty()) {
            os << "    " << d.source_line << "\n";
            if (loc.column > 0) {
                os << "    " << caret_padding(d.source_line, loc.column) << "^\n";
            }
        }
    }
}

}  // namespace logsim
