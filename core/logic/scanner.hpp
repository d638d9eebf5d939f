// ==============================================================================
// Circuit Scanner
// ==============================================================================
// Turns circuit definition text into symbols on demand. Skips whitespace,
// '#' line comments and '!...!' block comments, and tracks line/column for
// diagnostics. Unknown characters become INVALID symbols rather than
// exceptions so the parser can report them and carry on.
// ==============================================================================

#ifndef LOGSIM_LOGIC_SCANNER_HPP
#define LOGSIM_LOGIC_SCANNER_HPP

#include <string>
#include <vector>
#include "types.hpp"
#include "names.hpp"

namespace logsim {

enum class SymbolType {
    KEYWORD,        // DEVICES, CONNECT, MONITOR, END and the device kinds
    NAME,           // device names and pin names
    NUMBER,         // digit sequences (parameters and waveforms)
    COMMA,
    SEMICOLON,
    COLON,
    DOT,
    ARROW,
    END_OF_FILE,
    INVALID         // unrecognised character or unterminated comment
};

const char* symbol_type_to_string(SymbolType type);

struct Symbol {
    SymbolType type = SymbolType::END_OF_FILE;
    NameId id = 0;              // interned text for KEYWORD, NAME and NUMBER
    std::string text;
    LineNumber line = 0;
    ColumnNumber column = 0;
};

class Scanner {
public:
    // Keywords are interned into `names` on construction
    Scanner(NameTable& names, const std::string& source);

    /**
     * @brief Scan and return the next symbol
     *
     * Once the end of the source is reached every further call returns an
     * END_OF_FILE symbol.
     */
    Symbol get_symbol();

    // Source text of a 1-based line, without its newline ("" if out of range)
    std::string get_line_text(LineNumber line) const;

    static bool is_keyword(const std::string& text);

private:
    void skip_whitespace_and_comments();
    char advance_char();
    Symbol make_symbol(SymbolType type, size_t start,
                       LineNumber line, ColumnNumber column);

    NameTable& names_;
    std::string source_;
    std::vector<size_t> line_starts_;
    size_t pos_ = 0;
    LineNumber line_ = 1;
    ColumnNumber column_ = 1;

    // Set when skipping hits an unterminated '!' comment
    bool unterminated_comment_ = false;
    LineNumber comment_line_ = 0;
    ColumnNumber comment_column_ = 0;
};

}  // namespace logsim

#endif  // LOGSIM_LOGIC_SCANNER_HPP
