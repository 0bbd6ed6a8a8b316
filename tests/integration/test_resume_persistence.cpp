/**
 * @file test_resume_persistence.cpp
 * @brief Resume, restart recovery and reconciliation with the backend
 */

#include "test_fixtures.h"

#include <thread>

namespace kcenon::resumable_upload::test {

class ResumePersistenceTest : public ManagerFixture {
protected:
    /**
     * @brief Write a record as a process that died mid-upload would leave it
     *
     * The remote upload exists and holds the given parts; the local record
     * is uploading and lists local_parts.
     */
    auto write_interrupted_session(const std::vector<uint8_t>& data,
                                   const std::vector<int32_t>& remote_parts,
                                   const std::vector<int32_t>& local_parts,
                                   int64_t chunk_size = 1000) -> upload_session {
        upload_session session("project-1", "media/a.bin", "a.bin",
                               static_cast<int64_t>(data.size()),
                               "application/octet-stream", chunk_size);

        initiate_request request{session.project_id, session.storage_key, session.file_name,
                                 session.file_size, session.mime_type};
        auto initiated = backend_->initiate_upload(request);
        EXPECT_TRUE(initiated.has_value());
        upload_target target{initiated.value().upload_id, session.storage_key,
                             session.project_id};

        std::map<int32_t, part_receipt> receipts;
        for (auto part : remote_parts) {
            auto offset = static_cast<std::size_t>((part - 1) * chunk_size);
            auto length = std::min(static_cast<std::size_t>(chunk_size), data.size() - offset);
            auto receipt = backend_->upload_part(
                target, part, std::span<const uint8_t>(data.data() + offset, length));
            EXPECT_TRUE(receipt.has_value());
            receipts[part] = receipt.value();
        }

        session_store store(session_store_config{store_dir_});
        EXPECT_TRUE(store.create(session).has_value());

        session_patch patch;
        patch.status = upload_status::uploading;
        patch.remote_upload_id = target.upload_id;
        for (auto part : local_parts) {
            const auto& receipt = receipts[part];
            patch.add_parts.push_back(uploaded_part{part, receipt.etag, receipt.size,
                                                    std::chrono::system_clock::now()});
        }
        auto updated = store.update(session.id, patch);
        EXPECT_TRUE(updated.has_value());
        return updated.has_value() ? updated.value() : session;
    }
};

// ============================================================================
// Restart recovery
// ============================================================================

TEST_F(ResumePersistenceTest, Restore_UploadingSessionBecomesPaused) {
    auto data = make_test_data(4000);
    auto written = write_interrupted_session(data, {1}, {1});
    build_manager(1000);

    auto restored = manager_->restore(written.id);
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(restored.value().status, upload_status::paused);
    EXPECT_EQ(restored.value().uploaded_count(), 1);

    auto statuses = recorder_.statuses(written.id);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0], upload_status::paused);
}

TEST_F(ResumePersistenceTest, Restore_UnknownSessionIsNotFound) {
    build_manager(1000);
    auto restored = manager_->restore(session_id::generate());
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::session_not_found);
}

TEST_F(ResumePersistenceTest, Restore_AllSkipsTerminalSessions) {
    auto data = make_test_data(3000);
    auto interrupted = write_interrupted_session(data, {}, {});
    {
        session_store store(session_store_config{store_dir_});
        upload_session done("p", "k", "b.bin", 1000, "", 1000);
        ASSERT_TRUE(store.create(done).has_value());
        ASSERT_TRUE(store.update(done.id, session_patch::with_status(upload_status::cancelled))
                        .has_value());
    }
    build_manager(1000);

    auto restored = manager_->restore_all();
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0], interrupted.id);
}

TEST_F(ResumePersistenceTest, Resume_RequiresMatchingSource) {
    auto data = make_test_data(4000);
    auto written = write_interrupted_session(data, {1}, {1});
    build_manager(1000);
    ASSERT_TRUE(manager_->restore(written.id).has_value());

    auto without = manager_->resume(written.id);
    ASSERT_FALSE(without);
    EXPECT_EQ(without.error().code, error_code::validation_error);

    auto renamed = manager_->resume(written.id, make_source("other.bin", 4000));
    ASSERT_FALSE(renamed);
    EXPECT_EQ(renamed.error().code, error_code::validation_error);

    auto resized = manager_->resume(written.id, make_source("a.bin", 3999));
    ASSERT_FALSE(resized);
    EXPECT_EQ(resized.error().code, error_code::validation_error);

    EXPECT_EQ(session_of(written.id).status, upload_status::paused);
}

TEST_F(ResumePersistenceTest, Resume_AfterRestartAdoptsRemoteParts) {
    auto data = make_test_data(4000);
    // Part 2 reached the backend but the process died before recording it
    auto written = write_interrupted_session(data, {1, 2}, {1});
    build_manager(1000);

    ASSERT_TRUE(manager_->resume(written.id, make_source("a.bin", 4000)));
    ASSERT_TRUE(manager_->wait(written.id, wait_timeout));

    auto session = session_of(written.id);
    EXPECT_EQ(session.status, upload_status::completed);
    EXPECT_EQ(backend_->attempts(1), 1);
    EXPECT_EQ(backend_->attempts(2), 1);
    EXPECT_EQ(backend_->upload_calls(), 4);
    EXPECT_EQ(backend_->assembled(*session.remote_upload_id), data);
}

TEST_F(ResumePersistenceTest, Resume_PendingSessionStarts) {
    upload_session session("p", "k", "a.bin", 2500, "", 1000);
    {
        session_store store(session_store_config{store_dir_});
        ASSERT_TRUE(store.create(session).has_value());
    }
    build_manager(1000);

    ASSERT_TRUE(manager_->resume(session.id, make_source("a.bin", 2500)));
    ASSERT_TRUE(manager_->wait(session.id, wait_timeout));
    EXPECT_EQ(session_of(session.id).status, upload_status::completed);
    EXPECT_EQ(backend_->initiate_calls(), 1);
}

// ============================================================================
// Idempotence
// ============================================================================

TEST_F(ResumePersistenceTest, Resume_NothingMissingCompletesWithoutUploads) {
    auto data = make_test_data(4000);
    auto written = write_interrupted_session(data, {1, 2, 3, 4}, {1, 2, 3, 4});
    build_manager(1000);
    auto uploads_before = backend_->upload_calls();

    ASSERT_TRUE(manager_->resume(written.id, make_source("a.bin", 4000)));
    ASSERT_TRUE(manager_->wait(written.id, wait_timeout));

    EXPECT_EQ(session_of(written.id).status, upload_status::completed);
    EXPECT_EQ(backend_->upload_calls(), uploads_before);
    EXPECT_EQ(backend_->complete_calls(), 1);
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_F(ResumePersistenceTest, Resume_PartLostRemotelyIsUploadedAgain) {
    build_manager(1000, 2);
    backend_->hold_parts();

    auto id = manager_->start(make_source("a.bin", 4000), "p", "k");
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(backend_->wait_for_held(2));
    ASSERT_TRUE(manager_->pause(id.value()));
    backend_->release_parts();
    ASSERT_TRUE(manager_->wait(id.value(), wait_timeout));

    auto remote = session_of(id.value()).remote_upload_id.value_or("");
    backend_->forget_part(remote, 1);

    ASSERT_TRUE(manager_->resume(id.value()));
    ASSERT_TRUE(manager_->wait(id.value(), wait_timeout));

    EXPECT_EQ(session_of(id.value()).status, upload_status::completed);
    EXPECT_EQ(backend_->attempts(1), 2);
    EXPECT_EQ(backend_->attempts(2), 1);
    EXPECT_EQ(backend_->assembled(remote), make_test_data(4000));
}

TEST_F(ResumePersistenceTest, Resume_ListFailureKeepsSessionPaused) {
    build_manager(1000, 1);
    backend_->hold_parts();

    auto id = manager_->start(make_source("a.bin", 3000), "p", "k");
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(backend_->wait_for_held(1));
    ASSERT_TRUE(manager_->pause(id.value()));
    backend_->release_parts();
    ASSERT_TRUE(manager_->wait(id.value(), wait_timeout));

    backend_->fail_list(error_code::backend_rejected);
    auto resumed = manager_->resume(id.value());
    ASSERT_FALSE(resumed);
    EXPECT_EQ(resumed.error().code, error_code::backend_rejected);
    EXPECT_EQ(session_of(id.value()).status, upload_status::paused);

    ASSERT_TRUE(manager_->resume(id.value()));
    ASSERT_TRUE(manager_->wait(id.value(), wait_timeout));
    EXPECT_EQ(session_of(id.value()).status, upload_status::completed);
}

// ============================================================================
// Persistence round-trip
// ============================================================================

TEST_F(ResumePersistenceTest, RoundTrip_InterruptedRunMatchesUninterruptedRun) {
    auto data = make_test_data(5500);

    // Reference run on its own backend and store
    std::vector<completed_part> reference;
    {
        auto reference_backend = std::make_shared<fake_upload_backend>();
        auto built = upload_manager::builder()
            .with_backend(reference_backend)
            .with_store_directory(test_dir_ / "reference")
            .with_chunk_size(1000)
            .with_retry_sleeper([](std::chrono::milliseconds) {})
            .build();
        ASSERT_TRUE(built.has_value());
        auto id = built.value().start(make_source("a.bin", 5500), "p", "k");
        ASSERT_TRUE(id.has_value());
        ASSERT_TRUE(built.value().wait(id.value(), wait_timeout));
        auto session = built.value().get_session(id.value());
        ASSERT_TRUE(session.has_value());
        reference = reference_backend->upload(*session.value().remote_upload_id)->completed_with;
    }
    ASSERT_EQ(reference.size(), 6u);

    // Interrupted run: pause after two parts, drop the manager, resume in a new one
    session_id id;
    build_manager(1000, 2);
    backend_->hold_parts();
    {
        auto started = manager_->start(make_source("a.bin", 5500), "p", "k");
        ASSERT_TRUE(started.has_value());
        id = started.value();
    }
    ASSERT_TRUE(backend_->wait_for_held(2));
    ASSERT_TRUE(manager_->pause(id));
    backend_->release_parts();
    ASSERT_TRUE(manager_->wait(id, wait_timeout));
    manager_.reset();

    build_manager(1000, 2);
    auto restored = manager_->restore_all();
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0], id);
    EXPECT_EQ(session_of(id).status, upload_status::paused);
    EXPECT_EQ(session_of(id).uploaded_count(), 2);

    ASSERT_TRUE(manager_->resume(id, make_source("a.bin", 5500)));
    ASSERT_TRUE(manager_->wait(id, wait_timeout));

    auto session = session_of(id);
    EXPECT_EQ(session.status, upload_status::completed);
    auto completed = backend_->upload(*session.remote_upload_id)->completed_with;
    ASSERT_EQ(completed.size(), reference.size());
    for (std::size_t i = 0; i < reference.size(); ++i) {
        EXPECT_EQ(completed[i].part_number, reference[i].part_number);
        EXPECT_EQ(completed[i].etag, reference[i].etag);
    }
    EXPECT_EQ(backend_->assembled(*session.remote_upload_id), data);
}

TEST_F(ResumePersistenceTest, Shutdown_LeavesUploadingSessionsPaused) {
    build_manager(1000, 1);
    backend_->hold_parts();

    auto id = manager_->start(make_source("a.bin", 3000), "p", "k");
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(backend_->wait_for_held(1));

    std::thread releaser([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        backend_->release_parts();
    });
    manager_.reset();
    releaser.join();

    session_store store(session_store_config{store_dir_});
    auto stored = store.get(id.value());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().status, upload_status::paused);
    EXPECT_EQ(stored.value().uploaded_count(), 1);
}

}  // namespace kcenon::resumable_upload::test
