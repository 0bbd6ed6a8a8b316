/**
 * @file json_utils.cpp
 * @brief Recursive-descent JSON reader and string escaping
 */

#include <kcenon/resumable_upload/core/json_utils.h>

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace kcenon::resumable_upload::json {

// ============================================================================
// Escaping
// ============================================================================

auto escape(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto quote(const std::string& s) -> std::string {
    return "\"" + escape(s) + "\"";
}

// ============================================================================
// value
// ============================================================================

auto value::make_bool(bool b) -> value {
    value v;
    v.kind_ = kind::boolean;
    v.bool_ = b;
    return v;
}

auto value::make_number(double n, std::string raw) -> value {
    value v;
    v.kind_ = kind::number;
    v.number_ = n;
    v.text_ = std::move(raw);
    return v;
}

auto value::make_string(std::string s) -> value {
    value v;
    v.kind_ = kind::string;
    v.text_ = std::move(s);
    return v;
}

auto value::make_array(std::vector<value> items) -> value {
    value v;
    v.kind_ = kind::array;
    v.items_ = std::move(items);
    return v;
}

auto value::make_object(std::map<std::string, value> members) -> value {
    value v;
    v.kind_ = kind::object;
    v.members_ = std::move(members);
    return v;
}

auto value::find(const std::string& key) const -> const value* {
    if (kind_ != kind::object) {
        return nullptr;
    }
    auto it = members_.find(key);
    return it != members_.end() ? &it->second : nullptr;
}

auto value::as_string() const -> std::optional<std::string> {
    if (kind_ != kind::string) return std::nullopt;
    return text_;
}

auto value::as_int64() const -> std::optional<int64_t> {
    if (kind_ == kind::number) {
        // Integers are parsed from the raw text so large byte counts stay exact
        char* end = nullptr;
        auto parsed = std::strtoll(text_.c_str(), &end, 10);
        if (end && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
        return static_cast<int64_t>(number_);
    }
    if (kind_ == kind::string) {
        char* end = nullptr;
        auto parsed = std::strtoll(text_.c_str(), &end, 10);
        if (!text_.empty() && end && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
    }
    return std::nullopt;
}

auto value::as_double() const -> std::optional<double> {
    if (kind_ != kind::number) return std::nullopt;
    return number_;
}

auto value::as_bool() const -> std::optional<bool> {
    if (kind_ != kind::boolean) return std::nullopt;
    return bool_;
}

auto value::get_string(const std::string& key) const -> std::optional<std::string> {
    const auto* member = find(key);
    return member ? member->as_string() : std::nullopt;
}

auto value::get_int64(const std::string& key) const -> std::optional<int64_t> {
    const auto* member = find(key);
    return member ? member->as_int64() : std::nullopt;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

constexpr int max_depth = 64;

class parser {
public:
    explicit parser(std::string_view text) : text_(text) {}

    auto parse_document() -> result<value> {
        auto v = parse_value(0);
        if (!v) {
            return v;
        }
        skip_ws();
        if (pos_ != text_.size()) {
            return fail("trailing characters");
        }
        return v;
    }

private:
    auto fail(const std::string& what) const -> unexpected {
        return unexpected(error{error_code::invalid_response,
            "malformed JSON at offset " + std::to_string(pos_) + ": " + what});
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto consume(char c) -> bool {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto parse_value(int depth) -> result<value> {
        if (depth > max_depth) {
            return fail("nesting too deep");
        }
        skip_ws();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }

        char c = text_[pos_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') {
            auto s = parse_string();
            if (!s) return unexpected(s.error());
            return value::make_string(std::move(s.value()));
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number();
        }
        if (text_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return value::make_bool(true);
        }
        if (text_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return value::make_bool(false);
        }
        if (text_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return value{};
        }
        return fail(std::string("unexpected character '") + c + "'");
    }

    auto parse_object(int depth) -> result<value> {
        ++pos_;
        std::map<std::string, value> members;

        if (consume('}')) {
            return value::make_object(std::move(members));
        }

        while (true) {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected member name");
            }
            auto key = parse_string();
            if (!key) return unexpected(key.error());

            if (!consume(':')) {
                return fail("expected ':'");
            }

            auto member = parse_value(depth + 1);
            if (!member) return member;
            members[std::move(key.value())] = std::move(member.value());

            if (consume(',')) continue;
            if (consume('}')) break;
            return fail("expected ',' or '}'");
        }

        return value::make_object(std::move(members));
    }

    auto parse_array(int depth) -> result<value> {
        ++pos_;
        std::vector<value> items;

        if (consume(']')) {
            return value::make_array(std::move(items));
        }

        while (true) {
            auto item = parse_value(depth + 1);
            if (!item) return item;
            items.push_back(std::move(item.value()));

            if (consume(',')) continue;
            if (consume(']')) break;
            return fail("expected ',' or ']'");
        }

        return value::make_array(std::move(items));
    }

    auto parse_string() -> result<std::string> {
        ++pos_;
        std::string out;

        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) break;

            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) {
                        return fail("truncated unicode escape");
                    }
                    auto code = std::strtoul(
                        std::string(text_.substr(pos_, 4)).c_str(), nullptr, 16);
                    pos_ += 4;
                    append_utf8(out, static_cast<uint32_t>(code));
                    break;
                }
                default:
                    return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    auto parse_number() -> result<value> {
        auto start = pos_;
        if (text_[pos_] == '-') ++pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                c == 'e' || c == 'E' || c == '+' || c == '-') {
                ++pos_;
            } else {
                break;
            }
        }

        std::string raw(text_.substr(start, pos_ - start));
        char* end = nullptr;
        double n = std::strtod(raw.c_str(), &end);
        if (!end || *end != '\0') {
            return fail("invalid number");
        }
        return value::make_number(n, std::move(raw));
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

auto parse(std::string_view text) -> result<value> {
    return parser(text).parse_document();
}

}  // namespace kcenon::resumable_upload::json
