#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace dbbridge {

namespace {

void replaceAll(std::string& str, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

std::string FormatConverter::normalizeFilter(const std::string& filter) {
    std::string result = filter;
    replaceAll(result, "‘", "'");
    replaceAll(result, "’", "'");
    replaceAll(result, "“", "\"");
    replaceAll(result, "”", "\"");
    replaceAll(result, "\\'", "'");
    return result;
}

std::string FormatConverter::normalizeSortDirection(const std::optional<std::string>& direction) {
    if (direction && toUpper(trim(*direction)) == "DESC") {
        return "DESC";
    }
    return "ASC";
}

bool FormatConverter::isValidUtf8(const char* data, size_t length) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;
    while (i < length) {
        unsigned char c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        // Allowed range of the first continuation byte
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) low = 0xA0;   // overlong
            if (c == 0xED) high = 0x9F;  // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) low = 0x90;   // overlong
            if (c == 0xF4) high = 0x8F;  // above U+10FFFF
        } else {
            return false;
        }

        if (length - i <= extra) {
            return false;
        }
        if (bytes[i + 1] < low || bytes[i + 1] > high) {
            return false;
        }
        for (size_t k = 2; k <= extra; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string FormatConverter::bytesToHex(const unsigned char* data, size_t length) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string result = "\\x";
    result.reserve(2 + length * 2);
    for (size_t i = 0; i < length; ++i) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0F];
    }
    return result;
}

Value FormatConverter::placeholder(const std::string& typeName) {
    return Value("<" + typeName + ">");
}

std::optional<int64_t> FormatConverter::parseInt64(const std::string& text) {
    int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> FormatConverter::parseUInt64(const std::string& text) {
    uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> FormatConverter::parseDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Value FormatConverter::parseJsonOrString(const std::string& text) {
    Value parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(text);
    }
    return parsed;
}

Value FormatConverter::coerceText(const std::string& text) {
    if (auto i = parseInt64(text)) {
        return Value(*i);
    }
    if (auto d = parseDouble(text)) {
        return Value(*d);
    }
    return Value(text);
}

std::vector<Value> FormatConverter::parseJSONEachRow(const std::string& body) {
    std::vector<Value> rows;
    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) continue;

        Value row = json::parse(line, nullptr, false);
        if (row.is_discarded()) {
            spdlog::warn("Skipping unparseable JSONEachRow line: {}", line);
            continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

uint64_t FormatConverter::countFromValue(const Value& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (value.is_number_float()) {
        auto v = value.get<double>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (value.is_string()) {
        return parseUInt64(value.get<std::string>()).value_or(0);
    }
    return 0;
}

std::string FormatConverter::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string FormatConverter::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string FormatConverter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace dbbridge
