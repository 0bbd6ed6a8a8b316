/**
 * @file progress_reporter.h
 * @brief Derives percent, byte counts, throughput and ETA from part records
 */

#ifndef KCENON_RESUMABLE_UPLOAD_ENGINE_PROGRESS_REPORTER_H
#define KCENON_RESUMABLE_UPLOAD_ENGINE_PROGRESS_REPORTER_H

#include <kcenon/resumable_upload/core/upload_session.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Raw counters the metrics are computed from
 */
struct progress_input {
    const std::vector<uploaded_part>* parts = nullptr;
    int32_t total_chunks = 0;
    int64_t file_size = 0;
    int64_t chunk_size = 0;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point now;
};

/**
 * @brief Human-facing progress metrics
 */
struct progress_metrics {
    double percent = 0.0;
    int64_t uploaded_bytes = 0;
    int64_t total_bytes = 0;
    int32_t uploaded_parts = 0;
    int32_t total_parts = 0;

    /// Bytes per second over the trailing window, 0 when unknown
    double throughput = 0.0;

    /// Unknown until some throughput has been observed
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
};

/**
 * @brief Progress of one session as returned by get_progress()
 */
struct progress_snapshot {
    session_id id;
    upload_status status = upload_status::pending;
    progress_metrics metrics;
    std::optional<std::string> error;
};

/**
 * @brief Pure progress computation
 *
 * percent = uploaded parts / total parts * 100, clamped to [0, 100].
 * Throughput averages the bytes of parts completed within the trailing
 * window over the window length (shortened to the time since start).
 */
class progress_reporter {
public:
    static constexpr std::chrono::seconds default_window{30};

    explicit progress_reporter(std::chrono::milliseconds window = default_window);

    [[nodiscard]] auto compute(const progress_input& input) const -> progress_metrics;

    /**
     * @brief Snapshot of a session at a point in time
     *
     * A completed session always reports 100 percent, including empty files.
     */
    [[nodiscard]] auto snapshot(const upload_session& session,
                                std::chrono::system_clock::time_point now =
                                    std::chrono::system_clock::now()) const
        -> progress_snapshot;

    [[nodiscard]] auto window() const noexcept -> std::chrono::milliseconds {
        return window_;
    }

private:
    std::chrono::milliseconds window_;
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_ENGINE_PROGRESS_REPORTER_H
