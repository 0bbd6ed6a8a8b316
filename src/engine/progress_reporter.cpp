/**
 * @file progress_reporter.cpp
 * @brief Progress metric computation
 */

#include "kcenon/resumable_upload/engine/progress_reporter.h"

#include <algorithm>

namespace kcenon::resumable_upload {

progress_reporter::progress_reporter(std::chrono::milliseconds window)
    : window_(window.count() > 0 ? window : std::chrono::milliseconds(default_window)) {}

auto progress_reporter::compute(const progress_input& input) const -> progress_metrics {
    using namespace std::chrono;

    progress_metrics metrics;
    metrics.total_bytes = std::max<int64_t>(input.file_size, 0);
    metrics.total_parts = std::max<int32_t>(input.total_chunks, 0);

    if (input.parts == nullptr) {
        return metrics;
    }

    const auto window_start = std::max(input.now - window_, input.started_at);
    int64_t window_bytes = 0;

    for (const auto& part : *input.parts) {
        metrics.uploaded_bytes += part.size;
        if (part.completed_at >= window_start && part.completed_at <= input.now) {
            window_bytes += part.size;
        }
    }
    metrics.uploaded_bytes = std::min(metrics.uploaded_bytes, metrics.total_bytes);
    metrics.uploaded_parts = static_cast<int32_t>(input.parts->size());

    if (metrics.total_parts > 0) {
        auto percent = static_cast<double>(metrics.uploaded_parts) /
                       static_cast<double>(metrics.total_parts) * 100.0;
        metrics.percent = std::clamp(percent, 0.0, 100.0);
    }

    auto span = duration_cast<milliseconds>(input.now - window_start);
    if (span.count() > 0 && window_bytes > 0) {
        metrics.throughput = static_cast<double>(window_bytes) * 1000.0 /
                             static_cast<double>(span.count());
    }

    auto remaining = metrics.total_bytes - metrics.uploaded_bytes;
    if (remaining <= 0) {
        metrics.estimated_time_remaining = milliseconds(0);
    } else if (metrics.throughput > 0.0) {
        metrics.estimated_time_remaining = milliseconds(
            static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / metrics.throughput));
    }

    return metrics;
}

auto progress_reporter::snapshot(const upload_session& session,
                                 std::chrono::system_clock::time_point now) const
    -> progress_snapshot {
    progress_input input;
    input.parts = &session.parts;
    input.total_chunks = session.total_chunks;
    input.file_size = session.file_size;
    input.chunk_size = session.chunk_size;
    input.started_at = session.started_at;
    input.now = now;

    progress_snapshot snap;
    snap.id = session.id;
    snap.status = session.status;
    snap.metrics = compute(input);
    snap.error = session.error;

    if (session.status == upload_status::completed) {
        snap.metrics.percent = 100.0;
        snap.metrics.uploaded_bytes = snap.metrics.total_bytes;
    }
    return snap;
}

}  // namespace kcenon::resumable_upload
