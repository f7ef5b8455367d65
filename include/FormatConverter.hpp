#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace dbbridge {

using json = nlohmann::json;

// Universal row value: null, bool, number, string, array or object.
// Every driver converts its native rows into this shape.
using Value = json;

// Base class with database-independent conversion helpers.
// Backend converters derive from it and add their per-type dispatch.
class FormatConverter {
public:
    virtual ~FormatConverter() = default;

    // Replace typographic quotes with ASCII quotes and unescape \' so filter
    // expressions typed into auto-correcting editors remain valid SQL.
    static std::string normalizeFilter(const std::string& filter);

    // "ASC" or "DESC"; anything else falls back to "ASC"
    static std::string normalizeSortDirection(const std::optional<std::string>& direction);

    // Well-formed UTF-8 check: overlong forms, surrogates and code points
    // above U+10FFFF are rejected, matching what Value::dump() accepts.
    static bool isValidUtf8(const char* data, size_t length);

    // Binary to "\x0a1b..." text
    static std::string bytesToHex(const unsigned char* data, size_t length);

    // Placeholder used when a value cannot be converted at all
    static Value placeholder(const std::string& typeName);

    // Numeric parsing that rejects trailing garbage
    static std::optional<int64_t> parseInt64(const std::string& text);
    static std::optional<uint64_t> parseUInt64(const std::string& text);
    static std::optional<double> parseDouble(const std::string& text);

    // Parse JSON text, falling back to a plain string
    static Value parseJsonOrString(const std::string& text);

    // Best-effort coercion for text of an unknown type: integer, then float,
    // then the text itself.
    static Value coerceText(const std::string& text);

    // Parse newline-delimited JSON objects
    static std::vector<Value> parseJSONEachRow(const std::string& body);

    // Read an unsigned count that may arrive as a number or a quoted string
    static uint64_t countFromValue(const Value& value);

    static std::string trim(const std::string& str);
    static std::string toUpper(const std::string& str);
    static std::string toLower(const std::string& str);
};

}  // namespace dbbridge
