/**
 * @file upload_example.cpp
 * @brief Upload one file with progress reporting and error handling
 *
 * This example demonstrates:
 * - Building an upload_manager against an HTTP upload API
 * - Subscribing to progress, part and status events
 * - Waiting for the session to finish and reporting the outcome
 */

#include <kcenon/resumable_upload/resumable_upload.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

using namespace kcenon::resumable_upload;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_size(const std::string& text) -> int64_t {
    std::size_t pos = 0;
    double value = std::stod(text, &pos);

    if (pos < text.size()) {
        switch (std::toupper(static_cast<unsigned char>(text[pos]))) {
            case 'K': return static_cast<int64_t>(value * 1024);
            case 'M': return static_cast<int64_t>(value * 1024 * 1024);
            case 'G': return static_cast<int64_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<int64_t>(value);
}

/**
 * @brief Prints events as they arrive on the delivery thread
 */
struct console_listener {
    std::atomic<int>* last_percent;

    void operator()(const progress_event& event) const {
        auto percent = static_cast<int>(event.metrics.percent);
        if (percent == last_percent->exchange(percent)) {
            return;
        }
        std::cout << "\r  " << std::setw(3) << percent << "% "
                  << format_bytes(static_cast<uint64_t>(event.metrics.uploaded_bytes))
                  << " / " << format_bytes(static_cast<uint64_t>(event.metrics.total_bytes))
                  << "  " << format_bytes(static_cast<uint64_t>(event.metrics.throughput))
                  << "/s";
        if (event.metrics.estimated_time_remaining) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                *event.metrics.estimated_time_remaining);
            std::cout << "  ETA " << seconds.count() << "s";
        }
        std::cout << "      " << std::flush;
    }

    void operator()(const chunk_completed_event&) const {}

    void operator()(const error_event& event) const {
        std::cout << "\n  " << (event.fatal ? "error" : "warning") << ": "
                  << event.err.message;
        if (event.err.part_number) {
            std::cout << " (part " << *event.err.part_number << ")";
        }
        std::cout << std::endl;
    }

    void operator()(const status_changed_event& event) const {
        std::cout << "\n  status: " << to_string(event.from) << " -> "
                  << to_string(event.to) << std::endl;
    }
};

void print_usage(const char* program) {
    std::cout << "Upload Example - Resumable Upload Engine" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <storage_key>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --api <url>          Upload API base URL (required)" << std::endl;
    std::cout << "  -H, --header <k:v>       Extra header sent with API calls" << std::endl;
    std::cout << "  -p, --project <id>       Project id (default: default)" << std::endl;
    std::cout << "  -c, --chunk <size>       Part size, e.g. 8M (default: 8M)" << std::endl;
    std::cout << "  -j, --parallel <n>       Parts in flight (default: 3)" << std::endl;
    std::cout << "  -s, --store <dir>        Session store directory" << std::endl;
    std::cout << "  --adaptive               Pick a larger part size for large files" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    upload_manager::builder builder;
    std::string project_id = "default";
    std::string api_url;
    std::string local_path;
    std::string storage_key;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-u" || arg == "--api") {
            api_url = next("--api");
        } else if (arg == "-H" || arg == "--header") {
            std::string header = next("--header");
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Error: header must look like Name:Value" << std::endl;
                return 1;
            }
            auto value = header.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            builder.with_api_header(header.substr(0, colon), value);
        } else if (arg == "-p" || arg == "--project") {
            project_id = next("--project");
        } else if (arg == "-c" || arg == "--chunk") {
            try {
                builder.with_chunk_size(parse_size(next("--chunk")));
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid part size: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "-j" || arg == "--parallel") {
            builder.with_max_concurrent_parts(
                static_cast<std::size_t>(std::stoul(next("--parallel"))));
        } else if (arg == "-s" || arg == "--store") {
            builder.with_store_directory(next("--store"));
        } else if (arg == "--adaptive") {
            builder.with_adaptive_chunk_size(true);
        } else if (local_path.empty()) {
            local_path = arg;
        } else if (storage_key.empty()) {
            storage_key = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (api_url.empty() || local_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (storage_key.empty()) {
        storage_key = std::filesystem::path(local_path).filename().string();
    }

    auto manager = builder.with_api_base_url(api_url).build();
    if (!manager) {
        std::cerr << "Error: " << manager.error().message << std::endl;
        return 1;
    }

    auto source = file_upload_source::open(local_path);
    if (!source) {
        std::cerr << "Error: " << source.error().message << std::endl;
        return 1;
    }

    std::cout << "Uploading " << local_path << " ("
              << format_bytes(static_cast<uint64_t>(source.value()->size())) << ") as "
              << storage_key << std::endl;

    std::atomic<int> last_percent{-1};
    auto subscription = manager.value().subscribe([&](const upload_event& event) {
        std::visit(console_listener{&last_percent}, event);
    });

    auto id = manager.value().start(source.value(), project_id, storage_key);
    if (!id) {
        std::cerr << "Error: " << id.error().message << std::endl;
        return 1;
    }
    std::cout << "Session " << id.value().to_string() << std::endl;

    while (!manager.value().wait(id.value(), std::chrono::seconds(1))) {
    }
    manager.value().flush_events();
    manager.value().unsubscribe(subscription);

    auto session = manager.value().get_session(id.value());
    if (!session) {
        std::cerr << "Error: " << session.error().message << std::endl;
        return 1;
    }

    std::cout << std::endl;
    if (session.value().status == upload_status::completed) {
        std::cout << "Upload completed: " << session.value().total_chunks << " parts" << std::endl;
        return 0;
    }

    std::cout << "Upload ended as " << to_string(session.value().status);
    if (session.value().error) {
        std::cout << ": " << *session.value().error;
    }
    std::cout << std::endl;
    std::cout << "Resume later with: resume_upload --api " << api_url << " "
              << id.value().to_string() << " " << local_path << std::endl;
    return 1;
}
