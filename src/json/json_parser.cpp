//! # JSON Parser Implementation
//!
//! Each `parse_*` function is entered with the cursor on the first token of
//! its construct and returns with the cursor just past it.
//!
//! ## Error Mapping
//!
//! | Situation | Error |
//! |-----------|-------|
//! | No tokens where a value is required | `UnexpectedEndOfInput` |
//! | Token that cannot start a value | `UnexpectedToken` |
//! | Array or object not closed | `UnexpectedEndOfInput` |
//! | Missing `,` between elements | `UnexpectedToken` |
//! | Non-string key | `UnexpectedToken` |
//! | Missing `:` after a key | `UnexpectedEndOfInput` |
//! | More than `MAX_DEPTH` nested containers | `MaxDepthExceeded` |
//!
//! Tokens after the root value are left unread and are not an error.

#include "json/json_parser.hpp"

#include "log/log.hpp"

namespace jsonfmt::json {

namespace {

/// Tracks one level of container nesting for the lifetime of a scope.
class DepthGuard {
public:
    explicit DepthGuard(size_t& depth) : depth_(depth) {
        ++depth_;
    }
    ~DepthGuard() {
        --depth_;
    }
    DepthGuard(const DepthGuard&) = delete;
    auto operator=(const DepthGuard&) -> DepthGuard& = delete;

private:
    size_t& depth_;
};

} // anonymous namespace

JsonParser::JsonParser(std::vector<JsonToken> tokens) : tokens_(std::move(tokens)) {}

auto JsonParser::peek() const -> const JsonToken* {
    if (pos_ >= tokens_.size()) {
        return nullptr;
    }
    return &tokens_[pos_];
}

auto JsonParser::advance() -> JsonToken& {
    return tokens_[pos_++];
}

// ============================================================================
// Entry Point
// ============================================================================

auto JsonParser::parse() -> Result<JsonValue, ParserError> {
    auto result = parse_value();
    if (is_err(result)) {
        JSONFMT_LOG_DEBUG("parser", "Failed after " << pos_ << " of " << tokens_.size()
                                                    << " tokens: "
                                                    << unwrap_err(result).to_string());
        return result;
    }

    // Only the first value is parsed; anything after it is not examined.
    if (pos_ < tokens_.size()) {
        JSONFMT_LOG_DEBUG("parser", "Ignoring " << (tokens_.size() - pos_)
                                                << " tokens after root value, first " << *peek());
    }

    JSONFMT_LOG_DEBUG("parser", "Parsed " << pos_ << " tokens");
    return result;
}

// ============================================================================
// Values
// ============================================================================

auto JsonParser::parse_value() -> Result<JsonValue, ParserError> {
    const auto* tok = peek();
    if (!tok) {
        return ParserError::unexpected_end_of_input();
    }

    switch (tok->kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::Number:
        return JsonValue(advance().number_value);
    case JsonTokenKind::String:
        return JsonValue(std::move(advance().string_value));
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::LBrace:
        return parse_object();
    default:
        return ParserError::unexpected_token(*tok);
    }
}

// ============================================================================
// Arrays
// ============================================================================

auto JsonParser::parse_array() -> Result<JsonValue, ParserError> {
    if (depth_ >= MAX_DEPTH) {
        return ParserError::max_depth_exceeded();
    }
    DepthGuard guard(depth_);

    advance(); // '['

    JsonArray array;
    const auto* tok = peek();
    if (tok && tok->kind == JsonTokenKind::RBracket) {
        advance();
        return JsonValue(std::move(array));
    }

    auto first = parse_value();
    if (is_err(first)) {
        return first;
    }
    array.push_back(std::move(unwrap(first)));

    while (const auto* next = peek()) {
        if (next->kind == JsonTokenKind::RBracket) {
            advance();
            return JsonValue(std::move(array));
        }
        if (next->kind != JsonTokenKind::Comma) {
            return ParserError::unexpected_token(*next);
        }
        advance(); // ','

        // A trailing comma lands here with `]` and fails as UnexpectedToken.
        auto elem = parse_value();
        if (is_err(elem)) {
            return elem;
        }
        array.push_back(std::move(unwrap(elem)));
    }

    return ParserError::unexpected_end_of_input();
}

// ============================================================================
// Objects
// ============================================================================

auto JsonParser::parse_object() -> Result<JsonValue, ParserError> {
    if (depth_ >= MAX_DEPTH) {
        return ParserError::max_depth_exceeded();
    }
    DepthGuard guard(depth_);

    advance(); // '{'

    JsonObject object;
    const auto* tok = peek();
    if (tok && tok->kind == JsonTokenKind::RBrace) {
        advance();
        return JsonValue(std::move(object));
    }

    if (auto error = parse_member(object)) {
        return std::move(*error);
    }

    while (const auto* next = peek()) {
        if (next->kind == JsonTokenKind::RBrace) {
            advance();
            return JsonValue(std::move(object));
        }
        if (next->kind != JsonTokenKind::Comma) {
            return ParserError::unexpected_token(*next);
        }
        advance(); // ','

        if (auto error = parse_member(object)) {
            return std::move(*error);
        }
    }

    return ParserError::unexpected_end_of_input();
}

auto JsonParser::parse_member(JsonObject& object) -> std::optional<ParserError> {
    const auto* key = peek();
    if (!key) {
        return ParserError::unexpected_end_of_input();
    }
    if (key->kind != JsonTokenKind::String) {
        return ParserError::unexpected_token(*key);
    }
    std::string name = std::move(advance().string_value);

    // Any token other than ':' is reported as end of input, not as an
    // unexpected token.
    const auto* colon = peek();
    if (!colon || colon->kind != JsonTokenKind::Colon) {
        return ParserError::unexpected_end_of_input();
    }
    advance();

    auto value = parse_value();
    if (is_err(value)) {
        return std::move(unwrap_err(value));
    }
    object.emplace_back(std::move(name), std::move(unwrap(value)));
    return std::nullopt;
}

// ============================================================================
// Convenience Function
// ============================================================================

auto parse(std::vector<JsonToken> tokens) -> Result<JsonValue, ParserError> {
    JsonParser parser(std::move(tokens));
    return parser.parse();
}

} // namespace jsonfmt::json
