// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file codec.cpp
/// @brief Tagged JSON wire format: writer, parser and tag classification.

#include <faunadb/codec.h>
#include <faunadb/builders.h>

#include <algorithm>
#include <charconv>
#include <compare>
#include <cmath>
#include <cstdio>
#include <system_error>
#include <vector>

namespace faunadb {

// ============================================================
// Temporal formats
// ============================================================

namespace {

constexpr std::string_view tag_date = "@date";
constexpr std::string_view tag_ts = "@ts";
constexpr std::string_view tag_ref = "@ref";
constexpr std::string_view tag_set = "@set";
constexpr std::string_view tag_object = "object";

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// Parse exactly text.size() decimal digits
bool parse_digits(std::string_view text, int& out) noexcept
{
    if (text.empty()) return false;
    int result = 0;
    for (char c : text) {
        if (!is_digit(c)) return false;
        result = result * 10 + (c - '0');
    }
    out = result;
    return true;
}

std::optional<std::chrono::year_month_day> parse_ymd(std::string_view text)
{
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    int y = 0, m = 0, d = 0;
    if (!parse_digits(text.substr(0, 4), y) ||
        !parse_digits(text.substr(5, 2), m) ||
        !parse_digits(text.substr(8, 2), d)) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{y},
                                    std::chrono::month{static_cast<unsigned>(m)},
                                    std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

constexpr std::int64_t nanos_per_second = 1000000000;

/// Nanoseconds since the epoch as whole seconds plus a fraction in [0, 1e9)
struct SplitInstant {
    std::int64_t seconds = 0;
    std::int64_t nanos = 0;

    constexpr auto operator<=>(const SplitInstant&) const = default;
};

constexpr SplitInstant split_nanoseconds(std::int64_t count) noexcept
{
    SplitInstant split{count / nanos_per_second, count % nanos_per_second};
    if (split.nanos < 0) {
        split.nanos += nanos_per_second;
        --split.seconds;
    }
    return split;
}

// 1677-09-21T00:12:43.145224192Z .. 2262-04-11T23:47:16.854775807Z
constexpr SplitInstant earliest_instant = split_nanoseconds(TimePoint::min().time_since_epoch().count());
constexpr SplitInstant latest_instant = split_nanoseconds(TimePoint::max().time_since_epoch().count());

} // anonymous namespace

std::optional<std::string> format_date(const Date& date)
{
    const auto& ymd = date.ymd;
    const int y = static_cast<int>(ymd.year());
    if (!ymd.ok() || y < 0 || y > 9999) {
        return std::nullopt;
    }

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  y, static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return std::string{buf};
}

std::string format_time(const Time& time)
{
    using namespace std::chrono;

    // Day arithmetic stays in seconds: whole days at the ends of the
    // TimePoint range do not fit in int64 nanoseconds
    const SplitInstant split = split_nanoseconds(time.instant.time_since_epoch().count());
    const sys_seconds whole{seconds{split.seconds}};
    const auto day_point = floor<days>(whole);
    const year_month_day ymd{day_point};
    const hh_mm_ss<seconds> hms{whole - day_point};

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%09lldZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  static_cast<long long>(split.nanos));
    return std::string{buf};
}

std::optional<Date> parse_date(std::string_view text)
{
    auto ymd = parse_ymd(text);
    if (!ymd) return std::nullopt;
    return Date{*ymd};
}

std::optional<Time> parse_time(std::string_view text)
{
    using namespace std::chrono;

    // YYYY-MM-DDTHH:MM:SS[.fffffffff](Z|+HH:MM|-HH:MM)
    if (text.size() < 20) return std::nullopt;

    auto ymd = parse_ymd(text.substr(0, 10));
    if (!ymd) return std::nullopt;
    if (text[10] != 'T' && text[10] != 't') return std::nullopt;
    if (text[13] != ':' || text[16] != ':') return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    if (!parse_digits(text.substr(11, 2), hour) ||
        !parse_digits(text.substr(14, 2), minute) ||
        !parse_digits(text.substr(17, 2), second)) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::size_t pos = 19;
    std::int64_t fraction = 0;
    if (text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && is_digit(text[pos])) {
            if (++digits > 9) return std::nullopt;
            fraction = fraction * 10 + (text[pos] - '0');
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) fraction *= 10;
    }

    if (pos >= text.size()) return std::nullopt;

    std::int64_t offset_seconds = 0;
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        if (text.size() - pos != 6 || text[pos + 3] != ':') return std::nullopt;
        int oh = 0, om = 0;
        if (!parse_digits(text.substr(pos + 1, 2), oh) ||
            !parse_digits(text.substr(pos + 4, 2), om) ||
            oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (zone == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    const std::int64_t seconds = static_cast<std::int64_t>(sys_days{*ymd}.time_since_epoch().count()) * 86400 +
                                 hour * 3600 + minute * 60 + second - offset_seconds;

    // TimePoint counts nanoseconds in an int64
    const SplitInstant split{seconds, fraction};
    if (split < earliest_instant || split > latest_instant) return std::nullopt;

    // (seconds + 1) keeps the product in range at the earliest instant
    const std::int64_t count = seconds < 0
        ? (seconds + 1) * nanos_per_second + (fraction - nanos_per_second)
        : seconds * nanos_per_second + fraction;
    return Time{TimePoint{nanoseconds{count}}};
}

// ============================================================
// Encoding
// ============================================================

namespace {

// JSON escape special characters in strings
void append_escaped(std::string& out, std::string_view s)
{
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_double(std::string& out, double d)
{
    if (!std::isfinite(d)) {
        throw Error(ErrorCode::UnsupportedValue,
                    "Double " + std::to_string(d) + " has no JSON representation");
    }

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        throw Error(ErrorCode::UnsupportedValue, "Double could not be formatted");
    }
    std::string_view text{buf, static_cast<std::size_t>(end - buf)};
    out += text;
    // Keep the value a Double on the way back in
    if (text.find_first_of(".eE") == std::string_view::npos) {
        out += ".0";
    }
}

using Entry = std::pair<std::string_view, const Value*>;

std::vector<Entry> sorted_entries(const ValueMap& map)
{
    std::vector<Entry> entries;
    entries.reserve(map.size());
    for (const auto& [key, box] : map) {
        entries.emplace_back(key, &box.get());
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.first < b.first; });
    return entries;
}

class JsonWriter {
public:
    explicit JsonWriter(bool compact) : compact_(compact) {}

    void write(const Value& val, int indent_level)
    {
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                out_ += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out_ += arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out_ += std::to_string(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                append_double(out_, arg);
            } else if constexpr (std::is_same_v<T, std::string>) {
                append_escaped(out_, arg);
            } else if constexpr (std::is_same_v<T, Date>) {
                auto text = format_date(arg);
                if (!text) {
                    throw Error(ErrorCode::UnsupportedValue,
                                "Date is not a valid calendar date between years 0 and 9999");
                }
                write_tagged(tag_date, indent_level, [&] { append_escaped(out_, *text); });
            } else if constexpr (std::is_same_v<T, Time>) {
                write_tagged(tag_ts, indent_level, [&] { append_escaped(out_, format_time(arg)); });
            } else if constexpr (std::is_same_v<T, Ref>) {
                write_tagged(tag_ref, indent_level, [&] { append_escaped(out_, arg.id); });
            } else if constexpr (std::is_same_v<T, SetRef>) {
                write_tagged(tag_set, indent_level, [&] { write_map(arg.parameters, indent_level + 1); });
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                write_tagged(tag_object, indent_level, [&] { write_map(arg, indent_level + 1); });
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                write_vector(arg, indent_level);
            }
        }, val.data);
    }

    std::string take() { return std::move(out_); }

private:
    bool compact_;
    std::string out_;

    std::string indent(int level) const
    {
        return compact_ ? std::string{} : std::string(static_cast<std::size_t>(level) * 2, ' ');
    }

    void newline()
    {
        if (!compact_) out_ += '\n';
    }

    void key(std::string_view k)
    {
        append_escaped(out_, k);
        out_ += compact_ ? ":" : ": ";
    }

    /// {"<tag>": <payload>}
    template <typename Fn>
    void write_tagged(std::string_view tag, int indent_level, Fn&& payload)
    {
        out_ += '{';
        newline();
        out_ += indent(indent_level + 1);
        key(tag);
        payload();
        newline();
        out_ += indent(indent_level);
        out_ += '}';
    }

    void write_map(const ValueMap& map, int indent_level)
    {
        if (map.size() == 0) {
            out_ += "{}";
            return;
        }
        out_ += '{';
        newline();
        bool first = true;
        for (const auto& [k, v] : sorted_entries(map)) {
            if (!first) {
                out_ += ',';
                newline();
            }
            first = false;
            out_ += indent(indent_level + 1);
            key(k);
            write(*v, indent_level + 1);
        }
        newline();
        out_ += indent(indent_level);
        out_ += '}';
    }

    void write_vector(const ValueVector& vec, int indent_level)
    {
        if (vec.size() == 0) {
            out_ += "[]";
            return;
        }
        out_ += '[';
        newline();
        bool first = true;
        for (const auto& box : vec) {
            if (!first) {
                out_ += ',';
                newline();
            }
            first = false;
            out_ += indent(indent_level + 1);
            write(box.get(), indent_level + 1);
        }
        newline();
        out_ += indent(indent_level);
        out_ += ']';
    }
};

} // anonymous namespace

EncodeResult encode(const Value& val, bool compact)
{
    EncodeResult result;
    try {
        JsonWriter writer(compact);
        writer.write(val, 0);
        result.json = writer.take();
        result.success = true;
    } catch (const Error& e) {
        result.error_code = e.code();
        result.error_message = e.what();
        detail::log_error("encode", result.error_code, result.error_message);
    }
    return result;
}

// ============================================================
// Decoding, phase 1: generic JSON tree
// ============================================================

namespace {

/// Intermediate form of one JSON node before tag classification
struct JsonNode {
    enum class Kind { Null, Boolean, Integer, Number, String, Array, Object };

    Kind kind = Kind::Null;
    bool boolean = false;
    std::int64_t integer = 0;
    double number = 0.0;
    std::string text;                  // String payload
    std::vector<std::string> keys;     // Object member names, parallel to children
    std::vector<JsonNode> children;    // Array elements or Object member values
    std::size_t position = 0;          // Byte offset in the document
};

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    /// Parse a full document. Throws Error(MalformedJson) on any syntax error.
    JsonNode parse()
    {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("Empty JSON input");
        }
        JsonNode root = parse_value(0);
        skip_whitespace();
        if (pos_ != json_.size()) {
            fail("Unexpected trailing characters at position " + std::to_string(pos_));
        }
        return root;
    }

private:
    std::string_view json_;
    std::size_t pos_;

    [[noreturn]] static void fail(const std::string& message)
    {
        throw Error(ErrorCode::MalformedJson, message);
    }

    char peek() const
    {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume()
    {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace()
    {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (consume() != c) {
            fail(std::string("Expected '") + c + "' at position " + std::to_string(pos_ - 1));
        }
    }

    JsonNode parse_value(int depth)
    {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object(depth + 1);
        if (c == '[') return parse_array(depth + 1);
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || is_digit(c)) return parse_number();

        if (pos_ >= json_.size()) {
            fail("Unexpected end of input at position " + std::to_string(pos_));
        }
        fail("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    void check_depth(int depth) const
    {
        if (depth > FAUNADB_MAX_JSON_DEPTH) {
            fail("Nesting deeper than " + std::to_string(FAUNADB_MAX_JSON_DEPTH) +
                 " levels at position " + std::to_string(pos_));
        }
    }

    JsonNode parse_object(int depth)
    {
        check_depth(depth);
        JsonNode node;
        node.kind = JsonNode::Kind::Object;
        node.position = pos_;
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return node;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key at position " + std::to_string(pos_));
            }
            node.keys.push_back(parse_string_raw());
            expect(':');
            node.children.push_back(parse_value(depth));

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        return node;
    }

    JsonNode parse_array(int depth)
    {
        check_depth(depth);
        JsonNode node;
        node.kind = JsonNode::Kind::Array;
        node.position = pos_;
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return node;
        }

        while (true) {
            node.children.push_back(parse_value(depth));

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        return node;
    }

    unsigned parse_hex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("Invalid unicode escape at position " + std::to_string(pos_));
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("Invalid unicode escape at position " + std::to_string(pos_ - 1));
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned codepoint)
    {
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

    /// \uXXXX, combining surrogate pairs; lone surrogates become U+FFFD
    unsigned parse_unicode_escape()
    {
        unsigned code = parse_hex4();
        if (code >= 0xD800 && code <= 0xDBFF) {
            if (json_.substr(pos_, 2) == "\\u") {
                std::size_t saved = pos_;
                pos_ += 2;
                unsigned low = parse_hex4();
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    return 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                }
                pos_ = saved;
            }
            return 0xFFFD;
        }
        if (code >= 0xDC00 && code <= 0xDFFF) {
            return 0xFFFD;
        }
        return code;
    }

    std::string parse_string_raw()
    {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("Unescaped control character in string at position " + std::to_string(pos_ - 1));
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    fail("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u':  append_utf8(result, parse_unicode_escape()); break;
                    default:
                        fail("Invalid escape sequence: \\" + std::string(1, escaped) +
                             " at position " + std::to_string(pos_ - 1));
                }
            } else {
                result += c;
            }
        }

        fail("Unterminated string");
    }

    JsonNode parse_string()
    {
        JsonNode node;
        node.kind = JsonNode::Kind::String;
        node.position = pos_;
        node.text = parse_string_raw();
        return node;
    }

    JsonNode parse_number()
    {
        JsonNode node;
        node.position = pos_;
        const std::size_t start = pos_;
        bool is_integer = true;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
        } else if (is_digit(peek())) {
            while (is_digit(peek())) consume();
        } else {
            fail("Invalid number at position " + std::to_string(start));
        }

        if (peek() == '.') {
            is_integer = false;
            consume();
            if (!is_digit(peek())) fail("Invalid number at position " + std::to_string(start));
            while (is_digit(peek())) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            is_integer = false;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!is_digit(peek())) fail("Invalid number at position " + std::to_string(start));
            while (is_digit(peek())) consume();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (is_integer) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{} && ptr == last) {
                node.kind = JsonNode::Kind::Integer;
                node.integer = value;
                return node;
            }
            // Too large for int64: keep it as a Double
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            fail("Number out of range at position " + std::to_string(start));
        }
        node.kind = JsonNode::Kind::Number;
        node.number = value;
        return node;
    }

    JsonNode parse_bool()
    {
        JsonNode node;
        node.kind = JsonNode::Kind::Boolean;
        node.position = pos_;
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            node.boolean = true;
            return node;
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            node.boolean = false;
            return node;
        }
        fail("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    JsonNode parse_null()
    {
        JsonNode node;
        node.position = pos_;
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return node;
        }
        fail("Expected 'null' at position " + std::to_string(pos_));
    }
};

// ============================================================
// Decoding, phase 2: classify nodes into Values
// ============================================================

[[noreturn]] void invalid_tag(std::string_view tag, const JsonNode& payload, std::string_view expected)
{
    throw Error(ErrorCode::InvalidTagPayload,
                "Invalid " + std::string{tag} + " payload at position " + std::to_string(payload.position) +
                ": expected " + std::string{expected});
}

Value classify(const JsonNode& node);

ValueMap classify_members(const JsonNode& node)
{
    ObjectBuilder builder;
    for (std::size_t i = 0; i < node.keys.size(); ++i) {
        builder.set(node.keys[i], classify(node.children[i]));
    }
    return builder.finish_map();
}

Value classify_object(const JsonNode& node)
{
    if (node.keys.size() == 1) {
        const std::string& key = node.keys.front();
        const JsonNode& payload = node.children.front();

        if (key == tag_date) {
            if (payload.kind != JsonNode::Kind::String) invalid_tag(key, payload, "a YYYY-MM-DD string");
            auto date = parse_date(payload.text);
            if (!date) invalid_tag(key, payload, "a YYYY-MM-DD string, got \"" + payload.text + "\"");
            return Value{*date};
        }
        if (key == tag_ts) {
            if (payload.kind != JsonNode::Kind::String) invalid_tag(key, payload, "an RFC 3339 timestamp string");
            auto time = parse_time(payload.text);
            if (!time) invalid_tag(key, payload, "an RFC 3339 timestamp string, got \"" + payload.text + "\"");
            return Value{*time};
        }
        if (key == tag_ref) {
            if (payload.kind != JsonNode::Kind::String) invalid_tag(key, payload, "an id string");
            return Value{Ref{payload.text}};
        }
        if (key == tag_set) {
            if (payload.kind != JsonNode::Kind::Object) invalid_tag(key, payload, "an object of parameters");
            return Value{SetRef{classify_members(payload)}};
        }
        if (key == tag_object && payload.kind == JsonNode::Kind::Object) {
            // Escaped user object: its members are never tags of the wrapper
            return Value{classify_members(payload)};
        }
    }

    // Any other object is a plain Object
    return Value{classify_members(node)};
}

Value classify(const JsonNode& node)
{
    switch (node.kind) {
        case JsonNode::Kind::Null:
            return Value{};
        case JsonNode::Kind::Boolean:
            return Value{node.boolean};
        case JsonNode::Kind::Integer:
            return Value{node.integer};
        case JsonNode::Kind::Number:
            return Value{node.number};
        case JsonNode::Kind::String:
            return Value{node.text};
        case JsonNode::Kind::Array: {
            ArrayBuilder builder;
            for (const auto& child : node.children) {
                builder.push_back(classify(child));
            }
            return builder.finish();
        }
        case JsonNode::Kind::Object:
            return classify_object(node);
    }
    return Value{};
}

} // anonymous namespace

ParseResult parse_json(std::string_view json)
{
    try {
        JsonParser parser(json);
        JsonNode root = parser.parse();
        return ParseResult::ok(classify(root));
    } catch (const Error& e) {
        detail::log_error("parse_json", e.code(), e.what());
        return ParseResult::failure(e.code(), e.what());
    }
}

} // namespace faunadb
