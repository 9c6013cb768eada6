#include "dtx/device/transport.hpp"
#include "dtx/events/event_bus.hpp"
#include "dtx/events/events.hpp"
#include "dtx/pipeline/pipeline_builder.hpp"
#include "dtx/pipeline/pipeline_runner.hpp"
#include "dtx/transfer/orchestrator.hpp"
#include "dtx/transfer/size_prober.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using dtx::ErrorKind;
using dtx::events::EventBus;
using dtx::events::SessionStateChangedEvent;
using dtx::events::SizeProbedEvent;
using dtx::events::TransferFinishedEvent;
using dtx::events::TransferProgressEvent;
using dtx::events::TransferStartedEvent;
using dtx::transfer::Direction;
using dtx::transfer::SessionState;
using dtx::transfer::TransferOrchestrator;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

/**
 * @brief Shell bodies of the fake adb, one per sub-command
 */
struct FakeAdb {
    std::string get_state = "echo device";
    std::string exec_out = "printf 'archive-bytes'";
    std::string du = "printf '1000\\t/sdcard/Transfer/x\\n'";
    std::string mkdir = "exit 0";
    std::string extract = "cat > /dev/null";
};

const char* kFakePv =
    "cat\n"
    "for n in 0 250 500 1000; do echo $n >&2; done";

const char* kFakeTar =
    "case \"$1\" in\n"
    "  -x) cat > /dev/null ;;\n"
    "  -c) printf 'local-archive' ;;\n"
    "esac";

/**
 * @brief Records every orchestrator event in emission order
 */
class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus) {
        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            std::lock_guard lock(mutex_);
            sequence_.push_back("started:" + std::to_string(e.session_id));
        });
        bus.subscribe<SessionStateChangedEvent>([this](const SessionStateChangedEvent& e) {
            std::lock_guard lock(mutex_);
            sequence_.push_back("state:" + std::to_string(e.session_id) + ":" + dtx::transfer::to_string(e.to));
        });
        bus.subscribe<SizeProbedEvent>([this](const SizeProbedEvent& e) {
            std::lock_guard lock(mutex_);
            sequence_.push_back("probed:" + std::to_string(e.session_id));
            probed_.push_back(e);
        });
        bus.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            std::lock_guard lock(mutex_);
            if (sequence_.empty() || sequence_.back() != "progress") {
                sequence_.push_back("progress");
            }
            progress_.push_back(e);
        });
        bus.subscribe<TransferFinishedEvent>([this](const TransferFinishedEvent& e) {
            std::lock_guard lock(mutex_);
            sequence_.push_back("finished:" + std::to_string(e.session_id) + ":" + dtx::transfer::to_string(e.state));
            finished_.push_back(e);
        });
    }

    std::vector<std::string> sequence() const {
        std::lock_guard lock(mutex_);
        return sequence_;
    }

    std::vector<TransferProgressEvent> progress() const {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    std::vector<SizeProbedEvent> probed() const {
        std::lock_guard lock(mutex_);
        return probed_;
    }

    std::vector<TransferFinishedEvent> finished() const {
        std::lock_guard lock(mutex_);
        return finished_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> sequence_;
    std::vector<TransferProgressEvent> progress_;
    std::vector<SizeProbedEvent> probed_;
    std::vector<TransferFinishedEvent> finished_;
};

} // namespace

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        bin_ = dir_.path() / "bin";
        local_ = dir_.path() / "local";
        fs::create_directories(bin_);

        config_.adb_path = (bin_ / "adb").string();
        config_.tar_path = dtx::test::write_script(bin_ / "tar", kFakeTar).string();
        config_.pv_path = dtx::test::write_script(bin_ / "pv", kFakePv).string();
        config_.poll_interval = 20ms;
        config_.termination_grace = 500ms;
        install_adb(FakeAdb{});
    }

    void TearDown() override {
        orchestrator_.reset();
    }

    void install_adb(const FakeAdb& adb) {
        dtx::test::write_script(bin_ / "adb",
            "if [ \"$1\" = \"-s\" ]; then shift 2; fi\n"
            "cmd=\"$1\"; shift\n"
            "case \"$cmd\" in\n"
            "  get-state) " + adb.get_state + " ;;\n"
            "  exec-out) " + adb.exec_out + " ;;\n"
            "  shell)\n"
            "    case \"$1\" in\n"
            "      du*) " + adb.du + " ;;\n"
            "      mkdir*) " + adb.mkdir + " ;;\n"
            "      tar*) " + adb.extract + " ;;\n"
            "    esac ;;\n"
            "esac");
    }

    TransferOrchestrator& orchestrator() {
        if (!orchestrator_) {
            transport_ = std::make_unique<dtx::device::AdbTransport>(config_);
            prober_ = std::make_unique<dtx::transfer::DefaultSizeProber>(*transport_);
            builder_ = std::make_unique<dtx::pipeline::PipelineBuilder>(config_, *transport_);
            dtx::pipeline::RunnerOptions options;
            options.poll_interval = config_.poll_interval;
            options.termination_grace = config_.termination_grace;
            runner_ = std::make_unique<dtx::pipeline::PipelineRunner>(options);
            orchestrator_ = std::make_unique<TransferOrchestrator>(config_, bus_, *transport_, *prober_,
                                                                   *builder_, *runner_);
        }
        return *orchestrator_;
    }

    bool wait_for_state(SessionState state, std::chrono::milliseconds timeout = 5000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto info = orchestrator().current_info();
            if (info && info->state == state) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    dtx::test::TempDir dir_{"dtx_orchestrator_test_"};
    fs::path bin_;
    fs::path local_;
    dtx::core::TransferConfig config_;
    EventBus bus_;
    EventRecorder recorder_{bus_};

    std::unique_ptr<dtx::device::AdbTransport> transport_;
    std::unique_ptr<dtx::transfer::DefaultSizeProber> prober_;
    std::unique_ptr<dtx::pipeline::PipelineBuilder> builder_;
    std::unique_ptr<dtx::pipeline::PipelineRunner> runner_;
    std::unique_ptr<TransferOrchestrator> orchestrator_;
};

TEST_F(TransferOrchestratorTest, PullReportsPercentAndCompletes) {
    auto started = orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM");
    ASSERT_TRUE(started.is_ok()) << started.error().describe();

    auto info = orchestrator().wait();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Completed);
    ASSERT_TRUE(info->total_bytes.has_value());
    EXPECT_EQ(*info->total_bytes, 1000u);
    EXPECT_EQ(info->transferred_bytes, 1000u);
    EXPECT_TRUE(fs::is_directory(local_ / "dest"));

    const auto progress = recorder_.progress();
    ASSERT_EQ(progress.size(), 4u);
    const double expected[] = {0.0, 25.0, 50.0, 100.0};
    for (std::size_t i = 0; i < progress.size(); ++i) {
        ASSERT_TRUE(progress[i].progress.percent.has_value());
        EXPECT_DOUBLE_EQ(*progress[i].progress.percent, expected[i]);
    }

    const auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].state, SessionState::Completed);
    EXPECT_FALSE(finished[0].error.has_value());
    EXPECT_FALSE(orchestrator().active());
}

TEST_F(TransferOrchestratorTest, EventsArriveInLifecycleOrder) {
    auto started = orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM");
    ASSERT_TRUE(started.is_ok());
    orchestrator().wait();

    const std::string id = std::to_string(started.value());
    const std::vector<std::string> expected = {
        "started:" + id,
        "state:" + id + ":Probing",
        "probed:" + id,
        "state:" + id + ":Running",
        "progress",
        "state:" + id + ":Completed",
        "finished:" + id + ":Completed",
    };
    EXPECT_EQ(recorder_.sequence(), expected);
}

TEST_F(TransferOrchestratorTest, FailedStageReportsDiagnostics) {
    FakeAdb adb;
    adb.exec_out = "echo 'tar: Missing: No such file or directory' >&2; exit 2";
    adb.du = "echo 'du: Missing: No such file or directory' >&2; exit 1";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "Missing").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    ASSERT_TRUE(info->last_error.has_value());
    EXPECT_EQ(info->last_error->kind, ErrorKind::PipelineStageFailed);
    EXPECT_EQ(info->last_error->stage, "remote-archive");

    const auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].state, SessionState::Failed);
    ASSERT_TRUE(finished[0].error.has_value());
    EXPECT_NE(finished[0].error->diagnostics.find("No such file or directory"), std::string::npos);
}

TEST_F(TransferOrchestratorTest, ProbeFailureDegradesToBytesOnly) {
    FakeAdb adb;
    adb.du = "echo 'du: permission denied' >&2; exit 1";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Completed);
    EXPECT_FALSE(info->total_bytes.has_value());

    const auto probed = recorder_.probed();
    ASSERT_EQ(probed.size(), 1u);
    EXPECT_FALSE(probed[0].known);
    ASSERT_TRUE(probed[0].error.has_value());
    EXPECT_EQ(probed[0].error->kind, ErrorKind::SizeProbeFailed);

    const auto progress = recorder_.progress();
    ASSERT_FALSE(progress.empty());
    for (const auto& event : progress) {
        EXPECT_FALSE(event.progress.percent.has_value());
    }
    EXPECT_EQ(progress.back().progress.bytes_transferred, 1000u);
}

TEST_F(TransferOrchestratorTest, ZeroSizeProbeMeansUnknownTotal) {
    FakeAdb adb;
    adb.du = "printf '0\\t/sdcard/Transfer\\n'";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Completed);
    EXPECT_FALSE(info->total_bytes.has_value());
    for (const auto& event : recorder_.progress()) {
        EXPECT_FALSE(event.progress.percent.has_value());
    }
}

TEST_F(TransferOrchestratorTest, MissingDeviceFailsPreflight) {
    FakeAdb adb;
    adb.get_state = "echo 'error: no devices/emulators found' >&2; exit 1";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    EXPECT_EQ(info->last_error->kind, ErrorKind::DeviceUnavailable);
    EXPECT_TRUE(recorder_.progress().empty());
    EXPECT_TRUE(recorder_.probed().empty());
    EXPECT_FALSE(fs::exists(local_ / "dest"));
}

TEST_F(TransferOrchestratorTest, DeviceLostMidTransferIsDeviceUnavailable) {
    FakeAdb adb;
    adb.exec_out = "echo 'error: device offline' >&2; exit 1";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    EXPECT_EQ(info->last_error->kind, ErrorKind::DeviceUnavailable);
}

TEST_F(TransferOrchestratorTest, MissingMeterIsToolMissing) {
    config_.pv_path = (bin_ / "not-installed-pv").string();

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    EXPECT_EQ(info->last_error->kind, ErrorKind::ToolMissing);
    ASSERT_EQ(recorder_.finished().size(), 1u);
}

TEST_F(TransferOrchestratorTest, RemotePathOutsideRootIsRejected) {
    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "/data/secret").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    EXPECT_EQ(info->last_error->kind, ErrorKind::PathInvalid);
}

TEST_F(TransferOrchestratorTest, PushSendsLocalTree) {
    const auto source = dir_.path() / "music";
    dtx::test::write_file(source / "a.mp3", std::string(600, 'a'));
    dtx::test::write_file(source / "album" / "b.mp3", std::string(400, 'b'));

    ASSERT_TRUE(orchestrator().start(Direction::Push, source.string(), "Music").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Completed) << (info->last_error ? info->last_error->describe() : "");
    EXPECT_EQ(info->direction, Direction::Push);
    ASSERT_TRUE(info->total_bytes.has_value());
    EXPECT_EQ(*info->total_bytes, 1000u);

    const auto progress = recorder_.progress();
    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(*progress.back().progress.percent, 100.0);
}

TEST_F(TransferOrchestratorTest, PushArchiverFailureReportsStage) {
    dtx::test::write_script(bin_ / "tar",
        "case \"$1\" in\n"
        "  -x) cat > /dev/null ;;\n"
        "  -c) echo 'tar: ./album: No such file or directory' >&2; exit 2 ;;\n"
        "esac");
    const auto source = dir_.path() / "music";
    dtx::test::write_file(source / "a.mp3", std::string(100, 'a'));

    ASSERT_TRUE(orchestrator().start(Direction::Push, source.string(), "Music").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    ASSERT_TRUE(info->last_error.has_value());
    EXPECT_EQ(info->last_error->kind, ErrorKind::PipelineStageFailed);
    EXPECT_EQ(info->last_error->stage, "local-archive");
    ASSERT_TRUE(info->last_error->exit_code.has_value());
    EXPECT_EQ(*info->last_error->exit_code, 2);

    const auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 1u);
    ASSERT_TRUE(finished[0].error.has_value());
    EXPECT_NE(finished[0].error->diagnostics.find("No such file or directory"), std::string::npos);
}

TEST_F(TransferOrchestratorTest, PushMissingSourceIsPathInvalid) {
    ASSERT_TRUE(orchestrator().start(Direction::Push, (dir_.path() / "absent").string(), "Music").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Failed);
    EXPECT_EQ(info->last_error->kind, ErrorKind::PathInvalid);
}

TEST_F(TransferOrchestratorTest, CancelStopsRunningTransfer) {
    FakeAdb adb;
    adb.exec_out = "sleep 30";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    ASSERT_TRUE(wait_for_state(SessionState::Running));
    EXPECT_TRUE(orchestrator().active());

    const auto begin = std::chrono::steady_clock::now();
    orchestrator().cancel();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);

    auto info = orchestrator().current_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Cancelled);
    EXPECT_EQ(info->last_error->kind, ErrorKind::UserCancelled);
    EXPECT_FALSE(orchestrator().active());

    const auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].state, SessionState::Cancelled);
}

TEST_F(TransferOrchestratorTest, CancelWhileAnotherThreadWaits) {
    FakeAdb adb;
    adb.exec_out = "sleep 5";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    ASSERT_TRUE(wait_for_state(SessionState::Running));

    std::optional<dtx::transfer::TransferSessionInfo> waited;
    std::thread waiter([this, &waited]() { waited = orchestrator().wait(); });
    std::this_thread::sleep_for(200ms);

    const auto begin = std::chrono::steady_clock::now();
    orchestrator().cancel();
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    waiter.join();

    EXPECT_LT(elapsed, 2s);
    ASSERT_TRUE(waited.has_value());
    EXPECT_EQ(waited->state, SessionState::Cancelled);
    EXPECT_EQ(orchestrator().current_info()->state, SessionState::Cancelled);
}

TEST_F(TransferOrchestratorTest, CancelDuringRemoteSizeProbe) {
    FakeAdb adb;
    adb.du = "sleep 6";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    ASSERT_TRUE(wait_for_state(SessionState::Probing));
    std::this_thread::sleep_for(300ms);

    const auto begin = std::chrono::steady_clock::now();
    orchestrator().cancel();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 1500ms);
    auto info = orchestrator().current_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Cancelled);
    EXPECT_EQ(info->last_error->kind, ErrorKind::UserCancelled);
    EXPECT_TRUE(recorder_.probed().empty());
    EXPECT_TRUE(recorder_.progress().empty());
    ASSERT_EQ(recorder_.finished().size(), 1u);
}

TEST_F(TransferOrchestratorTest, CancelDuringDeviceCheck) {
    FakeAdb adb;
    adb.get_state = "sleep 6; echo device";
    install_adb(adb);

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    ASSERT_TRUE(wait_for_state(SessionState::Probing));
    std::this_thread::sleep_for(300ms);

    const auto begin = std::chrono::steady_clock::now();
    orchestrator().cancel();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1500ms);
    EXPECT_EQ(orchestrator().current_info()->state, SessionState::Cancelled);
}

TEST_F(TransferOrchestratorTest, StartCancelsPreviousSession) {
    FakeAdb adb;
    adb.exec_out = "sleep 30";
    install_adb(adb);

    auto first = orchestrator().start(Direction::Pull, (local_ / "one").string(), "DCIM");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(wait_for_state(SessionState::Running));

    auto second = orchestrator().start(Direction::Pull, (local_ / "two").string(), "DCIM");
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());

    orchestrator().cancel();

    const auto sequence = recorder_.sequence();
    const auto first_finished = std::find(sequence.begin(), sequence.end(),
                                          "finished:" + std::to_string(first.value()) + ":Cancelled");
    const auto second_started = std::find(sequence.begin(), sequence.end(),
                                          "started:" + std::to_string(second.value()));
    ASSERT_NE(first_finished, sequence.end());
    ASSERT_NE(second_started, sequence.end());
    EXPECT_LT(first_finished - sequence.begin(), second_started - sequence.begin());

    const auto finished = recorder_.finished();
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[1].session_id, second.value());
}

TEST_F(TransferOrchestratorTest, CancelFromEventHandlerDoesNotDeadlock) {
    FakeAdb adb;
    adb.exec_out = "sleep 30";
    install_adb(adb);

    bus_.subscribe<SessionStateChangedEvent>([this](const SessionStateChangedEvent& e) {
        if (e.to == SessionState::Running) {
            orchestrator().cancel();
        }
    });

    ASSERT_TRUE(orchestrator().start(Direction::Pull, (local_ / "dest").string(), "DCIM").is_ok());
    auto info = orchestrator().wait();

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, SessionState::Cancelled);
}

TEST_F(TransferOrchestratorTest, WaitAndCancelWithoutSession) {
    EXPECT_FALSE(orchestrator().wait().has_value());
    orchestrator().cancel();
    EXPECT_FALSE(orchestrator().active());
    EXPECT_FALSE(orchestrator().current_info().has_value());
}

TEST(LocalPreflightTest, PullAcceptsMissingDestinationUnderWritableDir) {
    dtx::test::TempDir dir;
    EXPECT_TRUE(TransferOrchestrator::check_local_path(Direction::Pull, (dir.path() / "a" / "b").string()).is_ok());
}

TEST(LocalPreflightTest, PullRejectsDestinationBelowFile) {
    dtx::test::TempDir dir;
    dtx::test::write_file(dir.path() / "file", "x");
    auto result = TransferOrchestrator::check_local_path(Direction::Pull, (dir.path() / "file" / "sub").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PathInvalid);
}

TEST(LocalPreflightTest, PushRequiresDirectory) {
    dtx::test::TempDir dir;
    dtx::test::write_file(dir.path() / "file", "x");

    EXPECT_TRUE(TransferOrchestrator::check_local_path(Direction::Push, dir.path().string()).is_ok());

    auto file = TransferOrchestrator::check_local_path(Direction::Push, (dir.path() / "file").string());
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().kind, ErrorKind::PathInvalid);

    auto empty = TransferOrchestrator::check_local_path(Direction::Push, "");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().kind, ErrorKind::PathInvalid);
}
