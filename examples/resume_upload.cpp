/**
 * @file resume_upload.cpp
 * @brief Resume interrupted uploads from the session store
 *
 * Without a session id the stored sessions are listed and stale ones are
 * swept. With a session id and the original file the session is restored,
 * reconciled against the parts the backend already holds and finished.
 */

#include <kcenon/resumable_upload/resumable_upload.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace kcenon::resumable_upload;

namespace {

void print_usage(const char* program) {
    std::cout << "Resume Example - Resumable Upload Engine" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " --api <url> [options] [<session_id> <local_file>]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --api <url>        Upload API base URL (required)" << std::endl;
    std::cout << "  -s, --store <dir>      Session store directory" << std::endl;
    std::cout << "  --cancel               Cancel the session instead of resuming it" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

void list_sessions(upload_manager& manager) {
    auto sessions = manager.list_sessions();
    if (sessions.empty()) {
        std::cout << "No stored sessions" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(38) << "SESSION" << std::setw(12) << "STATUS"
              << std::setw(10) << "PARTS" << "FILE" << std::endl;
    for (const auto& session : sessions) {
        std::cout << std::setw(38) << session.id.to_string()
                  << std::setw(12) << to_string(session.status)
                  << std::setw(10)
                  << (std::to_string(session.uploaded_count()) + "/" +
                      std::to_string(session.total_chunks))
                  << session.file_name << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    upload_manager::builder builder;
    std::string api_url;
    std::string id_text;
    std::string local_path;
    bool cancel = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-u" || arg == "--api") && i + 1 < argc) {
            api_url = argv[++i];
        } else if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            builder.with_store_directory(argv[++i]);
        } else if (arg == "--cancel") {
            cancel = true;
        } else if (id_text.empty()) {
            id_text = arg;
        } else if (local_path.empty()) {
            local_path = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (api_url.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto built = builder.with_api_base_url(api_url).build();
    if (!built) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }
    auto& manager = built.value();

    if (id_text.empty()) {
        auto swept = manager.sweep_expired();
        if (swept && swept.value() > 0) {
            std::cout << "Expired " << swept.value() << " stale sessions" << std::endl;
        }
        list_sessions(manager);
        return 0;
    }

    auto id = session_id::from_string(id_text);
    if (!id) {
        std::cerr << "Error: not a session id: " << id_text << std::endl;
        return 1;
    }

    auto restored = manager.restore(*id);
    if (!restored) {
        std::cerr << "Error: " << restored.error().message << std::endl;
        return 1;
    }

    if (cancel) {
        auto cancelled = manager.cancel(*id);
        if (!cancelled) {
            std::cerr << "Error: " << cancelled.error().message << std::endl;
            return 1;
        }
        std::cout << "Session cancelled" << std::endl;
        return 0;
    }

    if (local_path.empty()) {
        std::cerr << "Error: the original file is needed to resume" << std::endl;
        return 1;
    }

    auto source = file_upload_source::open(local_path, restored.value().mime_type);
    if (!source) {
        std::cerr << "Error: " << source.error().message << std::endl;
        return 1;
    }

    std::cout << "Resuming " << restored.value().file_name << ": "
              << restored.value().uploaded_count() << " of "
              << restored.value().total_chunks << " parts already uploaded" << std::endl;

    auto resumed = manager.resume(*id, source.value());
    if (!resumed) {
        std::cerr << "Error: " << resumed.error().message << std::endl;
        return 1;
    }

    while (!manager.wait(*id, std::chrono::seconds(1))) {
        auto progress = manager.get_progress(*id);
        if (progress) {
            std::cout << "\r  " << std::fixed << std::setprecision(1)
                      << progress.value().metrics.percent << "%   " << std::flush;
        }
    }

    auto session = manager.get_session(*id);
    if (!session) {
        std::cerr << "Error: " << session.error().message << std::endl;
        return 1;
    }
    std::cout << std::endl << "Session is " << to_string(session.value().status) << std::endl;
    return session.value().status == upload_status::completed ? 0 : 1;
}
