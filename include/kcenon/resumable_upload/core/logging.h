// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::resumable_upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view planner = "resumable_upload.planner";
    static constexpr std::string_view store = "resumable_upload.store";
    static constexpr std::string_view executor = "resumable_upload.executor";
    static constexpr std::string_view http = "resumable_upload.http";
    static constexpr std::string_view coordinator = "resumable_upload.coordinator";
    static constexpr std::string_view channel = "resumable_upload.channel";
    static constexpr std::string_view manager = "resumable_upload.manager";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks local file paths and file names in log output
 *
 * Upload sources are usually user media files, so the directory part of a
 * path is hidden and the file name is shortened to its first few characters.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }

        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        std::string filename = path.substr(last_sep + 1);
        return masked_dir + "/" + mask_filename(filename);
    }

    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string name = filename;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }
        if (name.size() <= config_.visible_chars) {
            return filename;
        }

        std::string visible = name.substr(0, config_.visible_chars);
        std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
        return visible + masked + ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string session_id;
    std::string file_name;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_uploaded;
    std::optional<int32_t> part_number;
    std::optional<int32_t> total_parts;
    std::optional<double> progress_percent;
    std::optional<uint32_t> attempt;
    std::optional<std::string> status;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!file_name.empty()) {
            add_field("file_name", masker ? masker->mask_filename(file_name) : file_name);
        }
        if (file_size) add_int("file_size", static_cast<int64_t>(*file_size));
        if (bytes_uploaded) add_int("bytes_uploaded", static_cast<int64_t>(*bytes_uploaded));
        if (part_number) add_int("part_number", *part_number);
        if (total_parts) add_int("total_parts", *total_parts);
        if (progress_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"progress_percent\":" << *progress_percent;
            first = false;
        }
        if (attempt) add_int("attempt", *attempt);
        if (status) add_field("status", *status);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 8);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\n': output += "\\n"; break;
                case '\r': output += "\\r"; break;
                case '\t': output += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        std::ostringstream hex;
                        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c));
                        output += hex.str();
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Logging front end for the upload engine
 *
 * Forwards to kcenon::logger when logger_system is linked, otherwise writes
 * one line per record to stderr.
 */
class upload_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when an upload_manager is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Set custom log callback (invoked before the sink)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_text = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
        }
#else
        if (format == log_output_format::text) {
            line_text = get_timestamp() + " [" +
                        std::string(log_level_to_string(level)) + "] " + line_text;
        }
        output_to_stderr(line_text);
#endif
    }

    void flush() {
#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << upload_log_context::escape(masker.mask(std::string(message))) << "\"";
        if (context) {
            oss << ",\"context\":" << context->to_json(&masker);
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if RESUMABLE_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define RU_LOG(level, category, message) \
    kcenon::resumable_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RU_LOG_CTX(level, category, message, context) \
    kcenon::resumable_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RU_LOG_TRACE(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::trace, category, message)

#define RU_LOG_DEBUG(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::debug, category, message)

#define RU_LOG_INFO(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::info, category, message)

#define RU_LOG_WARN(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::warn, category, message)

#define RU_LOG_ERROR(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::error, category, message)

#define RU_LOG_FATAL(category, message) \
    RU_LOG(kcenon::resumable_upload::log_level::fatal, category, message)

#define RU_LOG_DEBUG_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::debug, category, message, ctx)

#define RU_LOG_INFO_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::info, category, message, ctx)

#define RU_LOG_WARN_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::warn, category, message, ctx)

#define RU_LOG_ERROR_CTX(category, message, ctx) \
    RU_LOG_CTX(kcenon::resumable_upload::log_level::error, category, message, ctx)

} // namespace kcenon::resumable_upload
