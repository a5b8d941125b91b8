//! # JSON Parser Tests
//!
//! Leaves, arrays, objects, grammar violations, the depth limit and
//! tokens after the root value. Most tests build token sequences directly so they do
//! not depend on the tokenizer.

#include "json/json_formatter.hpp"
#include "json/json_parser.hpp"
#include "json/json_tokenizer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jsonfmt;
using namespace jsonfmt::json;

namespace {

auto tok(JsonTokenKind kind) -> JsonToken {
    return JsonToken::make(kind);
}

auto str(std::string value) -> JsonToken {
    return JsonToken::make_string(std::move(value));
}

auto num(double value) -> JsonToken {
    return JsonToken::make_number(value);
}

} // anonymous namespace

class JsonParserTest : public ::testing::Test {
protected:
    auto parse_ok(std::vector<JsonToken> tokens) -> JsonValue {
        auto result = parse(std::move(tokens));
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return JsonValue();
        }
        return std::move(unwrap(result));
    }

    auto parse_err(std::vector<JsonToken> tokens) -> ParserError {
        auto result = parse(std::move(tokens));
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }

    /// Tokenizes `text` first; the text must be lexically valid.
    auto parse_text(std::string_view text) -> Result<JsonValue, ParserError> {
        auto tokens = tokenize(text);
        EXPECT_TRUE(is_ok(tokens)) << text;
        if (is_err(tokens)) {
            return ParserError::unexpected_end_of_input();
        }
        return parse(std::move(unwrap(tokens)));
    }
};

// ============================================================================
// Leaves
// ============================================================================

TEST_F(JsonParserTest, Null) {
    EXPECT_TRUE(parse_ok({tok(JsonTokenKind::Null)}).is_null());
}

TEST_F(JsonParserTest, Booleans) {
    EXPECT_EQ(parse_ok({tok(JsonTokenKind::True)}), JsonValue(true));
    EXPECT_EQ(parse_ok({tok(JsonTokenKind::False)}), JsonValue(false));
}

TEST_F(JsonParserTest, Number) {
    EXPECT_EQ(parse_ok({num(42.0)}), JsonValue(42.0));
}

TEST_F(JsonParserTest, String) {
    EXPECT_EQ(parse_ok({str("hi")}), JsonValue("hi"));
}

// ============================================================================
// Arrays
// ============================================================================

TEST_F(JsonParserTest, EmptyArray) {
    auto value = parse_ok({tok(JsonTokenKind::LBracket), tok(JsonTokenKind::RBracket)});
    ASSERT_TRUE(value.is_array());
    EXPECT_EQ(value.size(), 0u);
}

TEST_F(JsonParserTest, ArrayOfMixedValues) {
    auto value = parse_ok({tok(JsonTokenKind::LBracket), num(1.0), tok(JsonTokenKind::Comma),
                           str("two"), tok(JsonTokenKind::Comma), tok(JsonTokenKind::Null),
                           tok(JsonTokenKind::RBracket)});

    ASSERT_TRUE(value.is_array());
    const auto& arr = value.as_array();
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(arr[0], JsonValue(1.0));
    EXPECT_EQ(arr[1], JsonValue("two"));
    EXPECT_TRUE(arr[2].is_null());
}

TEST_F(JsonParserTest, NestedArrays) {
    auto result = parse_text("[[], [[1]], 2]");
    ASSERT_TRUE(is_ok(result));
    const auto& arr = unwrap(result).as_array();
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(arr[0].size(), 0u);
    EXPECT_EQ(arr[1].as_array()[0].as_array()[0], JsonValue(1.0));
}

TEST_F(JsonParserTest, TrailingCommaInArray) {
    auto error = parse_err({tok(JsonTokenKind::LBracket), num(1.0), tok(JsonTokenKind::Comma),
                            tok(JsonTokenKind::RBracket)});
    EXPECT_EQ(error, ParserError::unexpected_token(tok(JsonTokenKind::RBracket)));
}

TEST_F(JsonParserTest, MissingCommaInArray) {
    auto error = parse_err(
        {tok(JsonTokenKind::LBracket), num(1.0), num(2.0), tok(JsonTokenKind::RBracket)});
    EXPECT_EQ(error, ParserError::unexpected_token(num(2.0)));
}

TEST_F(JsonParserTest, UnclosedArray) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBracket)}), ParserError::unexpected_end_of_input());
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBracket), num(1.0)}),
              ParserError::unexpected_end_of_input());
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBracket), num(1.0), tok(JsonTokenKind::Comma)}),
              ParserError::unexpected_end_of_input());
}

TEST_F(JsonParserTest, LeadingCommaInArray) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBracket), tok(JsonTokenKind::Comma), num(1.0),
                         tok(JsonTokenKind::RBracket)}),
              ParserError::unexpected_token(tok(JsonTokenKind::Comma)));
}

// ============================================================================
// Objects
// ============================================================================

TEST_F(JsonParserTest, EmptyObject) {
    auto value = parse_ok({tok(JsonTokenKind::LBrace), tok(JsonTokenKind::RBrace)});
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.size(), 0u);
}

TEST_F(JsonParserTest, ObjectMembersInOrder) {
    auto result = parse_text(R"({"b": 1, "a": [true], "c": {}})");
    ASSERT_TRUE(is_ok(result));
    const auto& obj = unwrap(result).as_object();
    ASSERT_EQ(obj.size(), 3u);
    EXPECT_EQ(obj[0].first, "b");
    EXPECT_EQ(obj[1].first, "a");
    EXPECT_EQ(obj[2].first, "c");
    EXPECT_EQ(obj[0].second, JsonValue(1.0));
    EXPECT_TRUE(obj[1].second.as_array()[0].as_bool());
    EXPECT_TRUE(obj[2].second.is_object());
}

TEST_F(JsonParserTest, DuplicateKeysPreserved) {
    auto result = parse_text(R"({"a": 1, "a": 2})");
    ASSERT_TRUE(is_ok(result));
    const auto& value = unwrap(result);
    const auto& obj = value.as_object();
    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj[0].first, "a");
    EXPECT_EQ(obj[0].second, JsonValue(1.0));
    EXPECT_EQ(obj[1].first, "a");
    EXPECT_EQ(obj[1].second, JsonValue(2.0));

    // Lookup finds the first occurrence
    EXPECT_EQ(*value.get("a"), JsonValue(1.0));
}

TEST_F(JsonParserTest, NonStringKey) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), num(1.0), tok(JsonTokenKind::Colon),
                         num(2.0), tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_token(num(1.0)));
}

TEST_F(JsonParserTest, MissingColonReportsEndOfInput) {
    // Both a missing token and a wrong token after the key
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a")}),
              ParserError::unexpected_end_of_input());
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a"), num(1.0),
                         tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_end_of_input());
}

TEST_F(JsonParserTest, TrailingCommaInObject) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a"), tok(JsonTokenKind::Colon),
                         num(1.0), tok(JsonTokenKind::Comma), tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_token(tok(JsonTokenKind::RBrace)));
}

TEST_F(JsonParserTest, MissingCommaInObject) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a"), tok(JsonTokenKind::Colon),
                         num(1.0), str("b"), tok(JsonTokenKind::Colon), num(2.0),
                         tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_token(str("b")));
}

TEST_F(JsonParserTest, UnclosedObject) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace)}), ParserError::unexpected_end_of_input());
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a"), tok(JsonTokenKind::Colon),
                         num(1.0), tok(JsonTokenKind::Comma)}),
              ParserError::unexpected_end_of_input());
}

TEST_F(JsonParserTest, MissingValueAfterColon) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::LBrace), str("a"), tok(JsonTokenKind::Colon),
                         tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_token(tok(JsonTokenKind::RBrace)));
}

// ============================================================================
// Sequence-Level Errors
// ============================================================================

TEST_F(JsonParserTest, EmptyTokenSequence) {
    EXPECT_EQ(parse_err({}), ParserError::unexpected_end_of_input());
}

TEST_F(JsonParserTest, TokenThatCannotStartValue) {
    EXPECT_EQ(parse_err({tok(JsonTokenKind::Colon)}),
              ParserError::unexpected_token(tok(JsonTokenKind::Colon)));
    EXPECT_EQ(parse_err({tok(JsonTokenKind::RBrace)}),
              ParserError::unexpected_token(tok(JsonTokenKind::RBrace)));
}

TEST_F(JsonParserTest, TokensAfterRootValueIgnored) {
    EXPECT_EQ(parse_ok({tok(JsonTokenKind::True), tok(JsonTokenKind::False)}), JsonValue(true));

    auto array = parse_ok({tok(JsonTokenKind::LBracket), num(1), tok(JsonTokenKind::RBracket),
                           num(2)});
    ASSERT_TRUE(array.is_array());
    ASSERT_EQ(array.size(), 1u);
    EXPECT_EQ(array.as_array()[0], JsonValue(1.0));

    // Leftovers are not checked, even when they could never form a value
    EXPECT_EQ(parse_ok({tok(JsonTokenKind::LBracket), tok(JsonTokenKind::RBracket),
                        tok(JsonTokenKind::RBracket), tok(JsonTokenKind::Colon)})
                  .size(),
              0u);
}

TEST_F(JsonParserTest, ErrorTokenKeepsLocation) {
    auto result = parse_text("[1,\n  ]");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    ASSERT_TRUE(error.token.has_value());
    EXPECT_EQ(error.token->line, 2u);
    EXPECT_EQ(error.token->column, 3u);
}

// ============================================================================
// Depth Limit
// ============================================================================

TEST_F(JsonParserTest, NestingAtLimitAccepted) {
    std::string text(JsonParser::MAX_DEPTH, '[');
    text.append(JsonParser::MAX_DEPTH, ']');
    EXPECT_TRUE(is_ok(parse_text(text)));
}

TEST_F(JsonParserTest, NestingBeyondLimitRejected) {
    std::string text(JsonParser::MAX_DEPTH + 1, '[');
    text.append(JsonParser::MAX_DEPTH + 1, ']');
    auto result = parse_text(text);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), ParserError::max_depth_exceeded());
}

TEST_F(JsonParserTest, DeepObjectsRejected) {
    std::string text;
    for (size_t i = 0; i <= JsonParser::MAX_DEPTH; ++i) {
        text += "{\"k\":";
    }
    text += "1";
    text.append(JsonParser::MAX_DEPTH + 1, '}');
    auto result = parse_text(text);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), ParserError::max_depth_exceeded());
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(ParserErrorTest, Messages) {
    EXPECT_EQ(ParserError::unexpected_end_of_input().to_string(), "Unexpected end of input");
    EXPECT_EQ(ParserError::unexpected_token(JsonToken::make(JsonTokenKind::RBracket)).to_string(),
              "Unexpected token: ']'");
    EXPECT_EQ(ParserError::unexpected_token(JsonToken::make_string("k")).to_string(),
              "Unexpected token: '\"k\"'");
    EXPECT_EQ(ParserError::unexpected_token(JsonToken::make_number(2.5)).to_string(),
              "Unexpected token: '2.5'");
    EXPECT_EQ(ParserError::max_depth_exceeded().to_string(), "Maximum nesting depth exceeded");
}
