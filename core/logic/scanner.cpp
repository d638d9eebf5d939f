// ==============================================================================
// Circuit Scanner Implementation
// ==============================================================================

#include "scanner.hpp"
#include <cctype>

namespace logsim {

namespace {

const char* const kKeywords[] = {
    "DEVICES", "CONNECT", "MONITOR", "END",
    "SWITCH", "CLOCK", "AND", "OR", "NAND", "NOR",
    "XOR", "DTYPE", "RC", "SIGGEN"
};

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

}  // namespace

const char* symbol_type_to_string(SymbolType type) {
    switch (type) {
        case SymbolType::KEYWORD:     return "keyword";
        case SymbolType::NAME:        return "name";
        case SymbolType::NUMBER:      return "number";
        case SymbolType::COMMA:       return "','";
        case SymbolType::SEMICOLON:   return "';'";
        case SymbolType::COLON:       return "':'";
        case SymbolType::DOT:         return "'.'";
        case SymbolType::ARROW:       return "'>'";
        case SymbolType::END_OF_FILE: return "end of file";
        case SymbolType::INVALID:     return "invalid character";
        default:                      return "unknown";
    }
}

Scanner::Scanner(NameTable& names, const std::string& source)
    : names_(names), source_(source)
{
    for (const char* keyword : kKeywords) {
        names_.lookup(keyword);
    }

    line_starts_.push_back(0);
    for (size_t i = 0; i < source_.size(); i++) {
        if (source_[i] == '\n') line_starts_.push_back(i + 1);
    }
}

bool Scanner::is_keyword(const std::string& text) {
    for (const char* keyword : kKeywords) {
        if (text == keyword) return true;
    }
    return false;
}

std::string Scanner::get_line_text(LineNumber line) const {
    if (line == 0 || line > line_starts_.size()) return "";
    size_t start = line_starts_[line - 1];
    size_t end = source_.find('\n', start);
    if (end == std::string::npos) end = source_.size();
    std::string text = source_.substr(start, end - start);
    if (!text.empty() && text.back() == '\r') text.pop_back();
    return text;
}

// ==============================================================================
// Character Handling
// ==============================================================================

char Scanner::advance_char() {
    char c = source_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else if (!is_continuation_byte(c)) {
        column_++;
    }
    return c;
}

void Scanner::skip_whitespace_and_comments() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];

        if (std::isspace(static_cast<unsigned char>(c))) {
            advance_char();
            continue;
        }

        // Line comment
        if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n') {
                advance_char();
            }
            continue;
        }

        // Block comment, closed by the next '!'
        if (c == '!') {
            LineNumber open_line = line_;
            ColumnNumber open_column = column_;
            advance_char();
            while (pos_ < source_.size() && source_[pos_] != '!') {
                advance_char();
            }
            if (pos_ >= source_.size()) {
                unterminated_comment_ = true;
                comment_line_ = open_line;
                comment_column_ = open_column;
                return;
            }
            advance_char();
            continue;
        }

        break;
    }
}

// ==============================================================================
// Symbols
// ==============================================================================

Symbol Scanner::make_symbol(SymbolType type, size_t start,
                            LineNumber line, ColumnNumber column) {
    Symbol sym;
    sym.type = type;
    sym.text = source_.substr(start, pos_ - start);
    sym.line = line;
    sym.column = column;
    if (type == SymbolType::KEYWORD || type == SymbolType::NAME ||
        type == SymbolType::NUMBER) {
        sym.id = names_.lookup(sym.text);
    }
    return sym;
}

Symbol Scanner::get_symbol() {
    skip_whitespace_and_comments();

    if (unterminated_comment_) {
        unterminated_comment_ = false;
        Symbol sym;
        sym.type = SymbolType::INVALID;
        sym.text = "!";
        sym.line = comment_line_;
        sym.column = comment_column_;
        return sym;
    }

    if (pos_ >= source_.size()) {
        Symbol eof;
        eof.type = SymbolType::END_OF_FILE;
        eof.line = line_;
        eof.column = column_;
        return eof;
    }

    size_t start = pos_;
    LineNumber line = line_;
    ColumnNumber column = column_;
    char c = advance_char();

    switch (c) {
        case ',': return make_symbol(SymbolType::COMMA, start, line, column);
        case ';': return make_symbol(SymbolType::SEMICOLON, start, line, column);
        case ':': return make_symbol(SymbolType::COLON, start, line, column);
        case '.': return make_symbol(SymbolType::DOT, start, line, column);
        case '>': return make_symbol(SymbolType::ARROW, start, line, column);
        default: break;
    }

    if (is_digit(c)) {
        while (pos_ < source_.size() && is_digit(source_[pos_])) {
            advance_char();
        }
        return make_symbol(SymbolType::NUMBER, start, line, column);
    }

    if (is_name_start(c)) {
        while (pos_ < source_.size() && is_name_char(source_[pos_])) {
            advance_char();
        }
        Symbol sym = make_symbol(SymbolType::NAME, start, line, column);
        if (is_keyword(sym.text)) sym.type = SymbolType::KEYWORD;
        return sym;
    }

    // A multibyte UTF-8 character is one invalid symbol
    while (pos_ < source_.size() && is_continuation_byte(source_[pos_])) {
        advance_char();
    }
    return make_symbol(SymbolType::INVALID, start, line, column);
}

}  // namespace logsim
