#include <gtest/gtest.h>
#include "../src/resumable_transfer.hpp"
#include "../src/local_store.hpp"
#include "fake_http_client.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

class ResumableTransferTest : public ::testing::Test {
protected:
    const std::string url = "https://mirror.example/media/clip.mp4";
    const std::string name = "clip.mp4";

    fs::path work_dir;
    FakeHttpClient http;
    RecordingProgress progress;
    std::unique_ptr<LocalStore> store;
    std::unique_ptr<SizeProber> prober;
    std::unique_ptr<ConnectivityMonitor> monitor;
    TransferPolicy policy;

    void SetUp() override {
        init_test_localization();
        work_dir = fs::absolute("tmp_transfer_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);

        store = std::make_unique<LocalStore>(work_dir / "temp", work_dir / "downloads");
        store->prepare();
        prober = std::make_unique<SizeProber>(http);
        monitor = std::make_unique<ConnectivityMonitor>(http, "https://probe.example");

        policy.max_retries = 10;
        policy.retry_delay = std::chrono::milliseconds(0);
        policy.connectivity_poll = std::chrono::milliseconds(1);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    ResumableTransfer make_transfer() {
        return ResumableTransfer(make_target(url), {http, *prober, *store, *monitor, progress}, policy);
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path temp_path() { return store->path_for(name, Location::TEMP); }
    fs::path final_path() { return store->path_for(name, Location::FINAL); }
};

TEST_F(ResumableTransferTest, FreshDownloadCompletes) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(read_file(final_path()), body);
    EXPECT_FALSE(fs::exists(temp_path()));
    ASSERT_EQ(http.ranges(url).size(), 1u);
    EXPECT_FALSE(http.ranges(url)[0].has_value());
    EXPECT_EQ(transfer.state().bytes_completed, 1000u);
    EXPECT_EQ(transfer.state().retry_count, 0u);
}

TEST_F(ResumableTransferTest, ResumesFromPartialFileWithRangeRequest) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    write_file(temp_path(), body.substr(0, 400));

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    const auto ranges = http.ranges(url);
    ASSERT_EQ(ranges.size(), 1u);
    ASSERT_TRUE(ranges[0].has_value());
    EXPECT_EQ(*ranges[0], 400u);

    EXPECT_EQ(fs::file_size(final_path()), 1000u);
    EXPECT_EQ(read_file(final_path()), body);
    EXPECT_EQ(progress.advanced_bytes(name), 600u);
    EXPECT_EQ(progress.finished_total(name).value_or(0), 1000u);
}

TEST_F(ResumableTransferTest, RestartsWhenServerIgnoresRange) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body, /*supports_range=*/false});
    write_file(temp_path(), std::string(400, 'x'));

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(read_file(final_path()), body);
    EXPECT_EQ(progress.count(name, RecordingProgress::Type::RESTART), 1);
    EXPECT_EQ(progress.advanced_bytes(name), 1000u);
    // Renegotiating the range is not a retry
    EXPECT_EQ(transfer.state().retry_count, 0u);
    EXPECT_EQ(http.get_count(url), 1);
}

TEST_F(ResumableTransferTest, AlreadyCompleteFileSkipsBodyFetch) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    write_file(final_path(), body);

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(http.get_count(url), 0);
    EXPECT_EQ(progress.finished_total(name).value_or(0), 1000u);
    EXPECT_EQ(transfer.state().bytes_completed, 1000u);
}

TEST_F(ResumableTransferTest, FinalFileWithWrongSizeIsDownloadedAgain) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    write_file(final_path(), body.substr(0, 10));

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(http.get_count(url), 1);
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, StaleFinalFileIsRemovedWhenDownloadFails) {
    http.add_resource(url, {make_body(1000)});
    http.add_failures(url, FakeHttpClient::FailureKind::REQUEST_FAILED, 100);
    write_file(final_path(), "truncated!");
    policy.max_retries = 1;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::FAILED);
    EXPECT_FALSE(fs::exists(final_path()));
}

TEST_F(ResumableTransferTest, RequestErrorsExhaustRetryBudget) {
    http.add_resource(url, {make_body(1000)});
    http.add_failures(url, FakeHttpClient::FailureKind::REQUEST_FAILED, 100);
    policy.max_retries = 3;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::FAILED);

    EXPECT_EQ(http.get_count(url), 4);
    EXPECT_EQ(transfer.state().retry_count, 4u);
    EXPECT_FALSE(fs::exists(final_path()));
    EXPECT_FALSE(transfer.last_error().empty());
}

TEST_F(ResumableTransferTest, RecoversAfterTransientRequestErrors) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    http.add_failures(url, FakeHttpClient::FailureKind::REQUEST_FAILED, 2);
    policy.max_retries = 2;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);
    EXPECT_EQ(transfer.state().retry_count, 2u);
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, ConnectivityLossNeverConsumesRetries) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    http.add_failures(url, FakeHttpClient::FailureKind::CONNECTIVITY_LOST, 5, 100);
    http.script_ping({false, false});
    policy.max_retries = 1;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(transfer.state().retry_count, 0u);
    EXPECT_EQ(read_file(final_path()), body);
    EXPECT_GE(http.ping_count(), 7);

    // Each reconnect resumes from what reached the disk
    const auto ranges = http.ranges(url);
    ASSERT_EQ(ranges.size(), 6u);
    EXPECT_FALSE(ranges[0].has_value());
    for (std::size_t i = 1; i < ranges.size(); ++i) {
        ASSERT_TRUE(ranges[i].has_value());
        EXPECT_EQ(*ranges[i], 100u * i);
    }
    EXPECT_EQ(progress.advanced_bytes(name), 1000u);
}

TEST_F(ResumableTransferTest, ConnectFailureWithNetworkUpCountsAsRetry) {
    http.add_resource(url, {make_body(1000)});
    http.add_failures(url, FakeHttpClient::FailureKind::CONNECT_FAILED, 2);
    policy.max_retries = 5;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);
    EXPECT_EQ(transfer.state().retry_count, 2u);
}

TEST_F(ResumableTransferTest, ConnectFailureWithNetworkDownWaitsInstead) {
    http.add_resource(url, {make_body(1000)});
    http.add_failures(url, FakeHttpClient::FailureKind::CONNECT_FAILED, 3);
    // Each failure: monitor says down, then the wait loop sees it come back
    http.script_ping({false, true, false, true, false, true});
    policy.max_retries = 0;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);
    EXPECT_EQ(transfer.state().retry_count, 0u);
    EXPECT_EQ(http.get_count(url), 4);
}

TEST_F(ResumableTransferTest, UnknownSizeCompletesWhenStreamEnds) {
    const std::string body = make_body(5000);
    http.add_resource(url, {body, true, /*advertise_length=*/false});

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    EXPECT_EQ(transfer.state().total_size, 0u);
    EXPECT_EQ(transfer.state().bytes_completed, 5000u);
    EXPECT_EQ(progress.finished_total(name).value_or(0), 5000u);
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, UnknownSizeStillResumesFromTempFile) {
    const std::string body = make_body(5000);
    http.add_resource(url, {body, true, false});
    write_file(temp_path(), body.substr(0, 1234));

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    const auto ranges = http.ranges(url);
    ASSERT_EQ(ranges.size(), 1u);
    ASSERT_TRUE(ranges[0].has_value());
    EXPECT_EQ(*ranges[0], 1234u);
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, ProgressIsMonotonicUntilRestart) {
    const std::string body = make_body(3000);
    http.add_resource(url, {body, false});
    write_file(temp_path(), std::string(700, 'x'));

    auto transfer = make_transfer();
    ASSERT_EQ(transfer.run(), Phase::COMPLETED);

    std::uint64_t completed = 700;
    int resets = 0;
    for (const auto& entry : progress.entries_for(name)) {
        if (entry.type == RecordingProgress::Type::RESTART) {
            completed = 0;
            ++resets;
        } else if (entry.type == RecordingProgress::Type::ADVANCE) {
            EXPECT_GT(entry.value, 0u);
            completed += entry.value;
        } else if (entry.type == RecordingProgress::Type::FINISH) {
            EXPECT_GE(entry.value, completed);
        }
    }
    EXPECT_EQ(resets, 1);
    EXPECT_EQ(completed, 3000u);
}

TEST_F(ResumableTransferTest, ProgressEventsRespectChunkSize) {
    http.add_resource(url, {make_body(1000)});
    http.set_block_size(1000);
    policy.chunk_size = 256;

    auto transfer = make_transfer();
    ASSERT_EQ(transfer.run(), Phase::COMPLETED);

    int events = 0;
    for (const auto& entry : progress.entries_for(name)) {
        if (entry.type != RecordingProgress::Type::ADVANCE) continue;
        EXPECT_LE(entry.value, 256u);
        ++events;
    }
    EXPECT_EQ(events, 4);
}

TEST_F(ResumableTransferTest, CompleteTempFileIsFinalizedWithoutFetch) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    write_file(temp_path(), body);

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);
    EXPECT_EQ(http.get_count(url), 0);
    EXPECT_EQ(read_file(final_path()), body);
    EXPECT_FALSE(fs::exists(temp_path()));
}

TEST_F(ResumableTransferTest, OversizedTempFileIsDiscarded) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    write_file(temp_path(), std::string(1500, 'x'));

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    const auto ranges = http.ranges(url);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_FALSE(ranges[0].has_value());
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, ReconnectsAreSpacedByPollInterval) {
    const std::string body = make_body(1000);
    http.add_resource(url, {body});
    http.add_failures(url, FakeHttpClient::FailureKind::CONNECTIVITY_LOST, 3, 0);
    policy.connectivity_poll = std::chrono::milliseconds(30);

    auto transfer = make_transfer();
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(http.get_count(url), 4);
    EXPECT_EQ(transfer.state().retry_count, 0u);
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST_F(ResumableTransferTest, RejectedRangeOnCompleteTempFileRestartsWithoutRange) {
    const std::string body = make_body(2000);
    http.add_resource(url, {body, true, /*advertise_length=*/false});
    write_file(temp_path(), body);
    policy.max_retries = 0;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::COMPLETED);

    const auto ranges = http.ranges(url);
    ASSERT_EQ(ranges.size(), 2u);
    ASSERT_TRUE(ranges[0].has_value());
    EXPECT_EQ(*ranges[0], 2000u);
    EXPECT_FALSE(ranges[1].has_value());
    EXPECT_EQ(transfer.state().retry_count, 0u);
    EXPECT_EQ(progress.count(name, RecordingProgress::Type::RESTART), 1);
    EXPECT_EQ(read_file(final_path()), body);
}

TEST_F(ResumableTransferTest, StorageFailuresConsumeRetries) {
    http.add_resource(url, {make_body(1000)});
    // A directory where the partial file should go cannot be opened for writing
    fs::create_directories(temp_path());
    policy.max_retries = 2;

    auto transfer = make_transfer();
    EXPECT_EQ(transfer.run(), Phase::FAILED);

    EXPECT_EQ(transfer.state().retry_count, 3u);
    EXPECT_EQ(http.get_count(url), 3);
    EXPECT_FALSE(fs::exists(final_path()));
    EXPECT_FALSE(transfer.last_error().empty());
}

TEST(PhaseTest, TerminalPhases) {
    EXPECT_TRUE(is_terminal(Phase::COMPLETED));
    EXPECT_TRUE(is_terminal(Phase::FAILED));
    EXPECT_FALSE(is_terminal(Phase::STREAMING));
    EXPECT_FALSE(is_terminal(Phase::RESUMING));
    EXPECT_EQ(phase_name(Phase::FINALIZING), "finalizing");
}
