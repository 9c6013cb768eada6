#include "dtx/core/config.hpp"
#include "dtx/core/format.hpp"
#include "dtx/core/logging.hpp"
#include "dtx/device/transport.hpp"
#include "dtx/events/components.hpp"
#include "dtx/events/event_bus.hpp"
#include "dtx/pipeline/pipeline_builder.hpp"
#include "dtx/pipeline/pipeline_runner.hpp"
#include "dtx/transfer/orchestrator.hpp"
#include "dtx/transfer/size_prober.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using dtx::transfer::Direction;
using dtx::transfer::SessionState;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = 1;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " (--pull | --push) --local <dir> [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --pull               Copy from the device to this host\n";
    std::cout << "  --push               Copy from this host to the device\n";
    std::cout << "  --local <dir>        Host directory (destination for pull, source for push)\n";
    std::cout << "  --remote <path>      Device path below the transfer root (default: the root)\n";
    std::cout << "  --config <file>      JSON configuration file\n";
    std::cout << "  --serial <serial>    adb device serial\n";
    std::cout << "  --log-level <level>  trace, debug, info, warn, error, critical, off\n";
    std::cout << "  --help               Show this help\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --pull --remote DCIM --local ~/Phone/DCIM\n";
    std::cout << "  " << program_name << " --push --local ~/Music --remote Music --serial R58M123ABC\n";
}

struct ProgressPrinter {
    void operator()(const dtx::events::SizeProbedEvent& e) const {
        if (e.known) {
            std::cout << "Total: " << dtx::core::format_bytes(e.total_bytes) << "\n";
        } else {
            std::cout << "Total: unknown\n";
        }
    }

    void operator()(const dtx::events::TransferProgressEvent& e) const {
        const auto& p = e.progress;
        std::cout << "\r";
        if (p.percent) {
            std::cout << static_cast<int>(*p.percent) << "% ";
        }
        std::cout << dtx::core::format_bytes(p.bytes_transferred) << " at "
                  << dtx::core::format_speed(p.smoothed_speed) << "     " << std::flush;
    }

    void operator()(const dtx::events::TransferFinishedEvent& e) const {
        std::cout << "\n" << dtx::transfer::to_string(e.state) << ": "
                  << dtx::core::format_bytes(e.transferred_bytes) << " in " << e.duration.count() << "ms\n";
        if (e.error) {
            std::cout << e.error->describe() << "\n";
            if (!e.error->diagnostics.empty()) {
                std::cout << e.error->diagnostics << "\n";
            }
        }
    }
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern(dtx::core::kDefaultLogPattern);

    std::optional<Direction> direction;
    std::string local_path;
    std::string remote_path;
    std::optional<std::string> config_path;
    std::optional<std::string> serial;
    std::optional<std::string> log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            spdlog::error("{} requires a value", option);
            return std::nullopt;
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--pull") {
            direction = Direction::Pull;
        } else if (arg == "--push") {
            direction = Direction::Push;
        } else if (arg == "--local") {
            auto value = next_value("--local");
            if (!value) {
                return 1;
            }
            local_path = *value;
        } else if (arg == "--remote") {
            auto value = next_value("--remote");
            if (!value) {
                return 1;
            }
            remote_path = *value;
        } else if (arg == "--config") {
            config_path = next_value("--config");
            if (!config_path) {
                return 1;
            }
        } else if (arg == "--serial") {
            serial = next_value("--serial");
            if (!serial) {
                return 1;
            }
        } else if (arg == "--log-level") {
            log_level = next_value("--log-level");
            if (!log_level) {
                return 1;
            }
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!direction || local_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    dtx::core::TransferConfig config;
    if (config_path) {
        auto loaded = dtx::core::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    if (serial) {
        config.device_serial = *serial;
    }
    if (log_level) {
        config.log_level = *log_level;
    }
    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("{}", valid.error().describe());
        return 1;
    }
    if (auto logging = dtx::core::configure_logging(config.log_level); logging.is_error()) {
        spdlog::error("{}", logging.error().describe());
        return 1;
    }

    dtx::pipeline::RunnerOptions runner_options;
    runner_options.poll_interval = config.poll_interval;
    runner_options.termination_grace = config.termination_grace;

    dtx::events::EventBus bus;
    dtx::events::LoggerComponent logger(bus);
    dtx::events::MetricsComponent metrics(bus);
    dtx::events::UpdateQueueComponent updates(bus);

    dtx::device::AdbTransport transport(config);
    dtx::transfer::DefaultSizeProber prober(transport);
    dtx::pipeline::PipelineBuilder builder(config, transport);
    dtx::pipeline::PipelineRunner runner(runner_options);
    dtx::transfer::TransferOrchestrator orchestrator(config, bus, transport, prober, builder, runner);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto started = orchestrator.start(*direction, local_path, remote_path);
    if (started.is_error()) {
        spdlog::error("{}", started.error().describe());
        return 1;
    }

    ProgressPrinter printer;
    bool cancel_sent = false;
    std::optional<SessionState> final_state;
    while (!final_state) {
        if (g_interrupted && !cancel_sent) {
            spdlog::info("Interrupted, cancelling transfer...");
            cancel_sent = true;
            orchestrator.cancel();
        }

        auto update = updates.queue().pop_for(std::chrono::milliseconds(200));
        if (!update) {
            continue;
        }
        std::visit(printer, *update);
        if (auto* finished = std::get_if<dtx::events::TransferFinishedEvent>(&*update)) {
            final_state = finished->state;
        }
    }

    orchestrator.wait();
    metrics.print_stats();
    return *final_state == SessionState::Completed ? 0 : 1;
}
