/**
 * @file upload_session.cpp
 * @brief Upload session helpers and merge-patch semantics
 */

#include <kcenon/resumable_upload/core/upload_session.h>
#include <kcenon/resumable_upload/core/chunk_planner.h>

#include <algorithm>
#include <set>

namespace kcenon::resumable_upload {

auto upload_status_from_string(const std::string& name) -> std::optional<upload_status> {
    for (auto status : {upload_status::pending, upload_status::uploading,
                        upload_status::paused, upload_status::completed,
                        upload_status::failed, upload_status::cancelled}) {
        if (name == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

// ============================================================================
// upload_session
// ============================================================================

upload_session::upload_session(std::string project, std::string key, std::string name,
                               int64_t size, std::string mime, int64_t part_size)
    : id(session_id::generate())
    , project_id(std::move(project))
    , storage_key(std::move(key))
    , file_name(std::move(name))
    , file_size(size)
    , mime_type(std::move(mime))
    , chunk_size(part_size)
    , total_chunks(calculate_total_chunks(size, part_size))
    , status(upload_status::pending)
    , started_at(std::chrono::system_clock::now())
    , last_activity(started_at) {
}

auto upload_session::has_part(int32_t part_number) const -> bool {
    return find_part(part_number) != nullptr;
}

auto upload_session::find_part(int32_t part_number) const -> const uploaded_part* {
    auto it = std::find_if(parts.begin(), parts.end(),
        [part_number](const uploaded_part& p) { return p.part_number == part_number; });
    return it != parts.end() ? &*it : nullptr;
}

auto upload_session::uploaded_count() const -> int32_t {
    return static_cast<int32_t>(parts.size());
}

auto upload_session::uploaded_bytes() const -> int64_t {
    int64_t total = 0;
    for (const auto& p : parts) {
        total += p.size;
    }
    return total;
}

auto upload_session::missing_parts() const -> std::vector<int32_t> {
    std::vector<int32_t> missing;
    for (int32_t n = 1; n <= total_chunks; ++n) {
        if (!has_part(n)) {
            missing.push_back(n);
        }
    }
    return missing;
}

// ============================================================================
// Merge patch
// ============================================================================

namespace {

auto validate_parts(const upload_session& session,
                    const std::vector<uploaded_part>& parts) -> result<void> {
    std::set<int32_t> seen;
    for (const auto& p : parts) {
        if (p.part_number < 1 || p.part_number > session.total_chunks) {
            return unexpected(error{error_code::invalid_input,
                "part " + std::to_string(p.part_number) + " outside 1.." +
                std::to_string(session.total_chunks)});
        }
        if (!seen.insert(p.part_number).second) {
            return unexpected(error{error_code::invalid_input,
                "part " + std::to_string(p.part_number) + " listed twice"});
        }
    }
    return {};
}

}  // namespace

auto apply_patch(upload_session& session, const session_patch& patch) -> result<void> {
    if (is_terminal(session.status)) {
        return unexpected(error{error_code::invalid_transition,
            std::string("session is ") + to_string(session.status)});
    }

    if (patch.status && !can_transition(session.status, *patch.status)) {
        return unexpected(error{error_code::invalid_transition,
            std::string("cannot move from ") + to_string(session.status) +
            " to " + to_string(*patch.status)});
    }

    if (patch.remote_upload_id && session.remote_upload_id &&
        *session.remote_upload_id != *patch.remote_upload_id) {
        return unexpected(error{error_code::invalid_transition,
            "remote upload id is already set"});
    }

    // Work on a copy so a rejected patch leaves the session untouched
    upload_session next = session;

    if (patch.chunk_size && *patch.chunk_size != next.chunk_size) {
        if (*patch.chunk_size <= 0) {
            return unexpected(error{error_code::invalid_input,
                "chunk size must be positive"});
        }
        if (!next.parts.empty()) {
            return unexpected(error{error_code::invalid_transition,
                "cannot change part size after parts were uploaded"});
        }
        next.chunk_size = *patch.chunk_size;
        next.total_chunks = calculate_total_chunks(next.file_size, next.chunk_size);
    }

    if (patch.storage_key) {
        next.storage_key = *patch.storage_key;
    }
    if (patch.remote_upload_id) {
        next.remote_upload_id = patch.remote_upload_id;
    }

    if (patch.replace_parts) {
        auto valid = validate_parts(next, *patch.replace_parts);
        if (!valid) {
            return valid;
        }
        next.parts = *patch.replace_parts;
    }

    if (!patch.add_parts.empty()) {
        auto valid = validate_parts(next, patch.add_parts);
        if (!valid) {
            return valid;
        }
        for (const auto& p : patch.add_parts) {
            auto it = std::find_if(next.parts.begin(), next.parts.end(),
                [&p](const uploaded_part& existing) {
                    return existing.part_number == p.part_number;
                });
            if (it != next.parts.end()) {
                *it = p;
            } else {
                next.parts.push_back(p);
            }
        }
    }

    if (patch.clear_error) {
        next.error.reset();
        next.error_part.reset();
    }
    if (patch.error) {
        next.error = patch.error;
        next.error_part = patch.error_part;
    }

    if (patch.status) {
        if (*patch.status == upload_status::completed && !next.is_complete()) {
            return unexpected(error{error_code::invalid_transition,
                "cannot complete with " + std::to_string(next.missing_parts().size()) +
                " parts missing"});
        }
        if (*patch.status == upload_status::uploading && !next.remote_upload_id) {
            return unexpected(error{error_code::invalid_transition,
                "cannot upload before the remote upload is initiated"});
        }
        next.status = *patch.status;
    }

    next.last_activity = std::chrono::system_clock::now();
    session = std::move(next);
    return {};
}

}  // namespace kcenon::resumable_upload
