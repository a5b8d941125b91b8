//! # JSON Pipeline
//!
//! Composes tokenizer, parser and formatter.

#include "json/json.hpp"

#include "log/log.hpp"

namespace jsonfmt::json {

auto parse_json(std::string_view content) -> Result<JsonValue, Error> {
    auto tokens = tokenize(content);
    if (is_err(tokens)) {
        return Error(std::move(unwrap_err(tokens)));
    }

    auto value = parse(std::move(unwrap(tokens)));
    if (is_err(value)) {
        return Error(std::move(unwrap_err(value)));
    }
    return std::move(unwrap(value));
}

auto format_json(std::string_view content, const FormatOptions& options)
    -> Result<std::string, Error> {
    JSONFMT_LOG_DEBUG("json", "Formatting " << content.size() << " bytes (indent "
                                            << options.indent << ")");

    auto value = parse_json(content);
    if (is_err(value)) {
        JSONFMT_LOG_DEBUG("json", "Rejected input: " << unwrap_err(value));
        return std::move(unwrap_err(value));
    }

    return format(unwrap(value), options);
}

} // namespace jsonfmt::json
