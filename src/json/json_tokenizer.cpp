//! # JSON Tokenizer Implementation
//!
//! Character-level scanning. Every scan routine starts with the cursor on
//! the first character of its construct and leaves it on the first
//! character after it.
//!
//! ## String Escapes
//!
//! | Escape | Decoded |
//! |--------|---------|
//! | `\"` `\\` `\/` | the character itself |
//! | `\b` `\f` `\n` `\r` `\t` | backspace, form feed, newline, carriage return, tab |
//! | `\uXXXX` | the scalar value as UTF-8 |
//! | `\uD8xx\uDCxx` | one supplementary-plane scalar |
//!
//! Raw control characters inside strings are accepted as-is.

#include "json/json_tokenizer.hpp"

#include "log/log.hpp"

#include <cstdlib>

namespace jsonfmt::json {

namespace {

constexpr uint32_t HIGH_SURROGATE_FIRST = 0xD800;
constexpr uint32_t HIGH_SURROGATE_LAST = 0xDBFF;
constexpr uint32_t LOW_SURROGATE_FIRST = 0xDC00;
constexpr uint32_t LOW_SURROGATE_LAST = 0xDFFF;

auto is_hex_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto hex_value(char c) -> uint32_t {
    if (c >= '0' && c <= '9') {
        return static_cast<uint32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint32_t>(c - 'a' + 10);
    }
    return static_cast<uint32_t>(c - 'A' + 10);
}

/// Parses exactly four hex digits.
auto parse_hex4(std::string_view digits, uint32_t& out) -> bool {
    if (digits.size() != 4) {
        return false;
    }
    uint32_t value = 0;
    for (char c : digits) {
        if (!is_hex_digit(c)) {
            return false;
        }
        value = (value << 4) | hex_value(c);
    }
    out = value;
    return true;
}

auto is_number_char(char c) -> bool {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == 'e' || c == 'E' || c == '.';
}

} // anonymous namespace

// ============================================================================
// Free Helpers
// ============================================================================

auto is_delimiter(char c) -> bool {
    switch (c) {
    case '[':
    case ']':
    case '{':
    case '}':
    case ':':
    case ',':
    case ' ':
    case '\t':
    case '\n':
    case '\r':
        return true;
    default:
        return false;
    }
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

// ============================================================================
// Cursor
// ============================================================================

JsonTokenizer::JsonTokenizer(std::string_view input) : input_(input) {}

auto JsonTokenizer::peek() const -> char {
    if (at_end()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonTokenizer::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

auto JsonTokenizer::make_token(JsonToken tok, const Mark& start) const -> JsonToken {
    tok.offset = start.offset;
    tok.line = start.line;
    tok.column = start.column;
    return tok;
}

auto JsonTokenizer::make_error(TokenizeErrorKind kind, std::string text, const Mark& at) const
    -> TokenizeError {
    auto error = TokenizeError::make(kind, std::move(text));
    error.offset = at.offset;
    error.line = at.line;
    error.column = at.column;
    return error;
}

// ============================================================================
// Main Loop
// ============================================================================

auto JsonTokenizer::tokenize() -> Result<std::vector<JsonToken>, TokenizeError> {
    std::vector<JsonToken> tokens;

    while (!at_end()) {
        char c = peek();
        Mark start = mark();

        switch (c) {
        case ' ':
        case '\t':
        case '\n':
        case '\r':
            advance();
            continue;
        case '[':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::LBracket), start));
            continue;
        case ']':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::RBracket), start));
            continue;
        case '{':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::LBrace), start));
            continue;
        case '}':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::RBrace), start));
            continue;
        case ':':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::Colon), start));
            continue;
        case ',':
            advance();
            tokens.push_back(make_token(JsonToken::make(JsonTokenKind::Comma), start));
            continue;
        default:
            break;
        }

        Result<JsonToken, TokenizeError> result = [&]() {
            if (c == '"') {
                return scan_string();
            }
            if (c == '-' || (c >= '0' && c <= '9')) {
                return scan_number();
            }
            return scan_literal();
        }();

        if (is_err(result)) {
            const auto& error = unwrap_err(result);
            JSONFMT_LOG_DEBUG("tokenizer", "Failed at " << error.line << ":" << error.column
                                                        << ": " << error.to_string());
            return std::move(unwrap_err(result));
        }
        tokens.push_back(std::move(unwrap(result)));
    }

    JSONFMT_LOG_DEBUG("tokenizer", "Produced " << tokens.size() << " tokens from "
                                               << input_.size() << " bytes");
    return tokens;
}

// ============================================================================
// Strings
// ============================================================================

auto JsonTokenizer::scan_string() -> Result<JsonToken, TokenizeError> {
    Mark start = mark();
    advance(); // Opening quote

    std::string value;
    while (!at_end()) {
        Mark char_start = mark();
        char c = advance();

        if (c == '"') {
            return make_token(JsonToken::make_string(std::move(value)), start);
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        if (at_end()) {
            return make_error(TokenizeErrorKind::UnexpectedEndOfInput, {}, mark());
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto codepoint = scan_unicode_escape(char_start);
            if (is_err(codepoint)) {
                return std::move(unwrap_err(codepoint));
            }
            append_utf8(value, unwrap(codepoint));
            break;
        }
        default: {
            // Report a multi-byte character whole, never a lone lead byte
            std::string text(1, escaped);
            while (!at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
                text += advance();
            }
            return make_error(TokenizeErrorKind::InvalidEscapeCharacter, std::move(text),
                              char_start);
        }
        }
    }

    return make_error(TokenizeErrorKind::UnexpectedEndOfInput, {}, mark());
}

auto JsonTokenizer::read_hex4() -> std::string {
    std::string digits;
    while (digits.size() < 4 && !at_end() && peek() != '"' &&
           static_cast<unsigned char>(peek()) < 0x80) {
        digits += advance();
    }
    return digits;
}

auto JsonTokenizer::scan_unicode_escape(const Mark& escape_start)
    -> Result<uint32_t, TokenizeError> {
    std::string digits = read_hex4();
    uint32_t unit = 0;
    if (!parse_hex4(digits, unit)) {
        return make_error(TokenizeErrorKind::InvalidEscapeCharacter, std::move(digits),
                          escape_start);
    }

    if (unit >= LOW_SURROGATE_FIRST && unit <= LOW_SURROGATE_LAST) {
        return make_error(TokenizeErrorKind::InvalidEscapeCharacter, std::move(digits),
                          escape_start);
    }
    if (unit < HIGH_SURROGATE_FIRST || unit > HIGH_SURROGATE_LAST) {
        return unit;
    }

    // A high surrogate must be followed directly by a low surrogate escape.
    if (input_.substr(pos_, 2) != "\\u") {
        return make_error(TokenizeErrorKind::InvalidEscapeCharacter, std::move(digits),
                          escape_start);
    }
    advance();
    advance();

    std::string low_digits = read_hex4();
    uint32_t low = 0;
    if (!parse_hex4(low_digits, low) || low < LOW_SURROGATE_FIRST || low > LOW_SURROGATE_LAST) {
        return make_error(TokenizeErrorKind::InvalidEscapeCharacter, std::move(digits),
                          escape_start);
    }

    return 0x10000 + ((unit - HIGH_SURROGATE_FIRST) << 10) + (low - LOW_SURROGATE_FIRST);
}

// ============================================================================
// Numbers
// ============================================================================

auto JsonTokenizer::scan_number() -> Result<JsonToken, TokenizeError> {
    Mark start = mark();

    std::string text;
    while (!at_end() && is_number_char(peek())) {
        text += advance();
    }

    // The whole text must convert; "1.2.3" and a bare "-" are rejected.
    // Out-of-range magnitudes saturate (ERANGE is not an error here).
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return make_error(TokenizeErrorKind::InvalidNumberLiteral, std::move(text), start);
    }

    return make_token(JsonToken::make_number(value), start);
}

// ============================================================================
// Barewords
// ============================================================================

auto JsonTokenizer::scan_literal() -> Result<JsonToken, TokenizeError> {
    Mark start = mark();

    std::string word;
    while (!at_end() && !is_delimiter(peek())) {
        word += advance();
    }

    if (word == "true") {
        return make_token(JsonToken::make(JsonTokenKind::True), start);
    }
    if (word == "false") {
        return make_token(JsonToken::make(JsonTokenKind::False), start);
    }
    if (word == "null") {
        return make_token(JsonToken::make(JsonTokenKind::Null), start);
    }
    return make_error(TokenizeErrorKind::UnexpectedLiteral, std::move(word), start);
}

// ============================================================================
// Convenience Function
// ============================================================================

auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, TokenizeError> {
    JsonTokenizer tokenizer(input);
    return tokenizer.tokenize();
}

} // namespace jsonfmt::json
