/**
 * @file session_id.h
 * @brief Opaque identifier of an upload session
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_SESSION_ID_H
#define KCENON_RESUMABLE_UPLOAD_CORE_SESSION_ID_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::resumable_upload {

/**
 * @brief Unique identifier for an upload session (16-byte random UUID)
 *
 * Generated once when the session is created and stable for its lifetime.
 * The string form is used as the key of the persisted record.
 */
struct session_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr session_id() noexcept = default;

    explicit constexpr session_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random session ID
     */
    [[nodiscard]] static auto generate() -> session_id;

    /**
     * @brief Convert to UUID string (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from UUID string, dashes optional
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<session_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const session_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const session_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

}  // namespace kcenon::resumable_upload

template <>
struct std::hash<kcenon::resumable_upload::session_id> {
    auto operator()(const kcenon::resumable_upload::session_id& id) const noexcept
        -> std::size_t {
        std::size_t result = 0;
        for (std::size_t i = 0; i < 16; i += sizeof(std::size_t)) {
            std::size_t block = 0;
            for (std::size_t j = 0;
                 j < sizeof(std::size_t) && (i + j) < 16; ++j) {
                block |= static_cast<std::size_t>(id.bytes[i + j]) << (j * 8);
            }
            result ^= block + 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        }
        return result;
    }
};

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_SESSION_ID_H
