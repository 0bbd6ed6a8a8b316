/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::resumable_upload::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

auto make_session(int64_t file_size, int64_t chunk_size, int32_t uploaded_count)
    -> upload_session {
    upload_session session("bench-project", "bench/file.bin", "file.bin", file_size,
                           "application/octet-stream", chunk_size);

    auto now = std::chrono::system_clock::now();
    session.started_at = now - std::chrono::minutes(5);

    for (int32_t part = 1; part <= uploaded_count && part <= session.total_chunks; ++part) {
        auto offset = static_cast<int64_t>(part - 1) * chunk_size;
        uploaded_part uploaded;
        uploaded.part_number = part;
        uploaded.etag = "etag-" + std::to_string(part);
        uploaded.size = std::min(chunk_size, file_size - offset);
        uploaded.completed_at = now - std::chrono::seconds(60 * part / uploaded_count);
        session.parts.push_back(std::move(uploaded));
    }
    return session;
}

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "resumable_upload_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto data = generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_.push_back(path);
    return path;
}

auto temp_file_manager::create_directory(const std::string& name) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path, ec);
    created_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_) {
        std::filesystem::remove_all(path, ec);
    }
    created_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

}  // namespace kcenon::resumable_upload::benchmark
