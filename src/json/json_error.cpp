//! # JSON Error Implementation
//!
//! Diagnostic rendering for tokenizer, parser and pipeline errors.

#include "json/json_error.hpp"

#include <ostream>

namespace jsonfmt::json {

auto TokenizeError::to_string() const -> std::string {
    switch (kind) {
    case TokenizeErrorKind::UnexpectedLiteral:
        return "Unexpected literal: '" + text + "'";
    case TokenizeErrorKind::UnexpectedCharacter:
        return "Unexpected character: '" + text + "'";
    case TokenizeErrorKind::UnexpectedEndOfInput:
        return "Unexpected end of input";
    case TokenizeErrorKind::InvalidEscapeCharacter:
        return "Invalid escape character: '" + text + "'";
    case TokenizeErrorKind::InvalidNumberLiteral:
        return "Invalid number literal: '" + text + "'";
    }
    return "Unknown tokenize error";
}

auto ParserError::to_string() const -> std::string {
    switch (kind) {
    case ParserErrorKind::UnexpectedToken:
        return "Unexpected token: '" + (token ? token->to_string() : std::string()) + "'";
    case ParserErrorKind::UnexpectedEndOfInput:
        return "Unexpected end of input";
    case ParserErrorKind::MaxDepthExceeded:
        return "Maximum nesting depth exceeded";
    }
    return "Unknown parser error";
}

auto Error::to_string() const -> std::string {
    return std::visit([](const auto& error) { return error.to_string(); }, data);
}

auto Error::line() const -> size_t {
    if (const auto* tokenize_error = std::get_if<TokenizeError>(&data)) {
        return tokenize_error->line;
    }
    const auto& parser_error = std::get<ParserError>(data);
    return parser_error.token ? parser_error.token->line : 0;
}

auto Error::column() const -> size_t {
    if (const auto* tokenize_error = std::get_if<TokenizeError>(&data)) {
        return tokenize_error->column;
    }
    const auto& parser_error = std::get<ParserError>(data);
    return parser_error.token ? parser_error.token->column : 0;
}

auto operator<<(std::ostream& os, const TokenizeError& error) -> std::ostream& {
    return os << error.to_string();
}

auto operator<<(std::ostream& os, const ParserError& error) -> std::ostream& {
    return os << error.to_string();
}

auto operator<<(std::ostream& os, const Error& error) -> std::ostream& {
    return os << error.to_string();
}

} // namespace jsonfmt::json
