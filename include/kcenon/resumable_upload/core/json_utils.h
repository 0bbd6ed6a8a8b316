/**
 * @file json_utils.h
 * @brief Minimal JSON reading and writing helpers
 *
 * Enough JSON for session records and the upload API payloads: objects,
 * arrays, strings, integers, doubles, booleans and null.
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_JSON_UTILS_H
#define KCENON_RESUMABLE_UPLOAD_CORE_JSON_UTILS_H

#include <kcenon/resumable_upload/core/types.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::resumable_upload::json {

/**
 * @brief Escape a string for embedding between JSON quotes
 */
[[nodiscard]] auto escape(const std::string& s) -> std::string;

/**
 * @brief Quote and escape a string
 */
[[nodiscard]] auto quote(const std::string& s) -> std::string;

/**
 * @brief Parsed JSON value
 */
class value {
public:
    enum class kind { null, boolean, number, string, array, object };

    value() = default;

    [[nodiscard]] static auto make_bool(bool b) -> value;
    [[nodiscard]] static auto make_number(double n, std::string raw) -> value;
    [[nodiscard]] static auto make_string(std::string s) -> value;
    [[nodiscard]] static auto make_array(std::vector<value> items) -> value;
    [[nodiscard]] static auto make_object(std::map<std::string, value> members) -> value;

    [[nodiscard]] auto type() const noexcept -> kind { return kind_; }
    [[nodiscard]] auto is_null() const noexcept -> bool { return kind_ == kind::null; }
    [[nodiscard]] auto is_object() const noexcept -> bool { return kind_ == kind::object; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return kind_ == kind::array; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return kind_ == kind::string; }
    [[nodiscard]] auto is_number() const noexcept -> bool { return kind_ == kind::number; }

    /**
     * @brief Member lookup; nullptr if absent or not an object
     */
    [[nodiscard]] auto find(const std::string& key) const -> const value*;

    [[nodiscard]] auto items() const -> const std::vector<value>& { return items_; }

    [[nodiscard]] auto as_string() const -> std::optional<std::string>;
    [[nodiscard]] auto as_int64() const -> std::optional<int64_t>;
    [[nodiscard]] auto as_double() const -> std::optional<double>;
    [[nodiscard]] auto as_bool() const -> std::optional<bool>;

    /**
     * @brief Convenience accessors for object members
     */
    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;
    [[nodiscard]] auto get_int64(const std::string& key) const -> std::optional<int64_t>;

private:
    kind kind_ = kind::null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string text_;
    std::vector<value> items_;
    std::map<std::string, value> members_;
};

/**
 * @brief Parse a JSON document
 * @return Parsed value, or invalid_response on malformed input
 */
[[nodiscard]] auto parse(std::string_view text) -> result<value>;

}  // namespace kcenon::resumable_upload::json

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_JSON_UTILS_H
