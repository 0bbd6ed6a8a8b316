/**
 * @file transfer_executor.cpp
 * @brief Retrying multipart-upload operations
 */

#include "kcenon/resumable_upload/transfer/transfer_executor.h"

#include <algorithm>

#include "kcenon/resumable_upload/core/logging.h"

namespace kcenon::resumable_upload {

namespace {

auto retry_logger(const std::string& operation) -> retry_policy::retry_observer {
    return [operation](std::size_t attempt, const error& err,
                       std::chrono::milliseconds delay) {
        upload_log_context ctx;
        ctx.attempt = static_cast<uint32_t>(attempt);
        ctx.part_number = err.part_number;
        ctx.error_message = err.message;
        RU_LOG_WARN_CTX(log_category::executor,
            operation + " failed, retrying in " + std::to_string(delay.count()) + "ms",
            ctx);
    };
}

auto is_gone(const error& err) -> bool {
    return err.code == error_code::not_found;
}

}  // namespace

transfer_executor::transfer_executor(std::shared_ptr<upload_backend> backend,
                                     executor_config config)
    : backend_(std::move(backend)), config_(std::move(config)) {}

auto transfer_executor::config() const -> const executor_config& {
    return config_;
}

auto transfer_executor::target_for(const upload_session& session) -> upload_target {
    upload_target target;
    target.upload_id = session.remote_upload_id.value_or("");
    target.storage_key = session.storage_key;
    target.project_id = session.project_id;
    return target;
}

// ============================================================================
// initiate
// ============================================================================

auto transfer_executor::initiate(const upload_session& session)
    -> result<initiate_response> {
    if (!backend_) {
        return unexpected{error{error_code::not_initialized, "no upload backend"}};
    }

    initiate_request request;
    request.project_id = session.project_id;
    request.storage_key = session.storage_key;
    request.file_name = session.file_name;
    request.file_size = session.file_size;
    request.mime_type = session.mime_type;

    auto outcome = config_.initiate_retry.execute(
        [&] { return backend_->initiate_upload(request); },
        retry_logger("initiate"));

    if (!outcome.has_value()) {
        RU_LOG_ERROR(log_category::executor,
            "initiate failed for " + session.id.to_string() + ": " +
            outcome.error().message);
        return unexpected{error{error_code::upload_init_failed,
            "initiate upload failed: " + outcome.error().message}};
    }

    RU_LOG_DEBUG(log_category::executor,
        "initiated remote upload " + outcome.value().upload_id +
        " for session " + session.id.to_string());
    return outcome;
}

// ============================================================================
// upload_part
// ============================================================================

auto transfer_executor::upload_part(const upload_target& target,
                                    int32_t part_number,
                                    std::span<const uint8_t> bytes)
    -> result<part_receipt> {
    if (!backend_) {
        return unexpected{error{error_code::not_initialized, "no upload backend"}};
    }
    if (target.upload_id.empty()) {
        return unexpected{error::chunk_failed(part_number, false,
            "part upload attempted before initiate")};
    }

    auto outcome = config_.part_retry.execute(
        [&]() -> result<part_receipt> {
            auto sent = backend_->upload_part(target, part_number, bytes);
            if (sent.has_value() || sent.error().code != error_code::duplicate_part) {
                if (!sent.has_value()) {
                    auto err = sent.error();
                    err.part_number = part_number;
                    return unexpected{err};
                }
                return sent;
            }

            // The backend already holds this part; adopt its record
            auto listed = backend_->list_parts(target);
            if (!listed.has_value()) {
                return unexpected{listed.error()};
            }
            auto it = std::find_if(listed.value().begin(), listed.value().end(),
                [part_number](const part_receipt& p) {
                    return p.part_number == part_number;
                });
            if (it == listed.value().end()) {
                return unexpected{error{error_code::conflict,
                    "duplicate part " + std::to_string(part_number) +
                    " not present in part listing"}};
            }
            RU_LOG_DEBUG(log_category::executor,
                "part " + std::to_string(part_number) +
                " already uploaded, using listed etag");
            return *it;
        },
        retry_logger("upload part " + std::to_string(part_number)));

    if (!outcome.has_value()) {
        const auto& err = outcome.error();
        return unexpected{error::chunk_failed(part_number, err.retryable,
            "part " + std::to_string(part_number) + " failed: " + err.message)};
    }
    return outcome;
}

// ============================================================================
// list_uploaded_parts
// ============================================================================

auto transfer_executor::list_uploaded_parts(const upload_target& target)
    -> result<std::vector<part_receipt>> {
    if (!backend_) {
        return unexpected{error{error_code::not_initialized, "no upload backend"}};
    }

    auto outcome = config_.list_retry.execute(
        [&] { return backend_->list_parts(target); },
        retry_logger("list parts"));
    if (!outcome.has_value()) {
        return outcome;
    }

    auto parts = std::move(outcome).value();
    std::sort(parts.begin(), parts.end(),
              [](const part_receipt& a, const part_receipt& b) {
                  return a.part_number < b.part_number;
              });
    parts.erase(std::unique(parts.begin(), parts.end(),
                            [](const part_receipt& a, const part_receipt& b) {
                                return a.part_number == b.part_number;
                            }),
                parts.end());
    return parts;
}

// ============================================================================
// complete / abort
// ============================================================================

auto transfer_executor::complete(const upload_target& target,
                                 std::vector<completed_part> parts) -> result<void> {
    if (!backend_) {
        return unexpected{error{error_code::not_initialized, "no upload backend"}};
    }

    std::sort(parts.begin(), parts.end(),
              [](const completed_part& a, const completed_part& b) {
                  return a.part_number < b.part_number;
              });

    auto outcome = config_.complete_retry.execute(
        [&] { return backend_->complete_upload(target, parts); },
        retry_logger("complete"));

    if (!outcome.has_value()) {
        const auto& err = outcome.error();
        std::string reason = err.message;
        if (err.code == error_code::missing_parts) {
            reason = "missing parts: " + err.message;
        } else if (err.code == error_code::etag_mismatch) {
            reason = "etag mismatch: " + err.message;
        }
        return unexpected{error{error_code::upload_complete_failed,
            "complete upload failed: " + reason}};
    }
    return {};
}

auto transfer_executor::abort(const upload_target& target) -> result<void> {
    if (!backend_) {
        return unexpected{error{error_code::not_initialized, "no upload backend"}};
    }
    if (target.upload_id.empty()) {
        return {};
    }

    auto outcome = config_.abort_retry.execute(
        [&]() -> result<void> {
            auto aborted = backend_->abort_upload(target);
            if (!aborted.has_value() && is_gone(aborted.error())) {
                return {};
            }
            return aborted;
        },
        retry_logger("abort"));

    if (!outcome.has_value()) {
        RU_LOG_WARN(log_category::executor,
            "abort of " + target.upload_id + " failed: " + outcome.error().message);
        return unexpected{error{error_code::upload_cancel_failed,
            "abort upload failed: " + outcome.error().message}};
    }
    return {};
}

}  // namespace kcenon::resumable_upload
