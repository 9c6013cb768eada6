#pragma once

/**
 * @file pipeline_runner.hpp
 * @brief Spawns a PipelineSpec and supervises it until every stage is reaped
 *
 * HOW IT WORKS:
 * 1. Setup commands run one after another (mkdir -p ...)
 * 2. Stages are forked in order; stage i's stdout is an OS pipe into
 *    stage i+1's stdin, so data never passes through this process
 * 3. One asio io_context waits for whichever comes first: a meter chunk,
 *    a diagnostic chunk, or the poll timer (stage exits + cancel flag)
 * 4. run() returns only after waitpid() succeeded for every stage
 *
 * EXIT POLICY:
 * Any non-zero stage fails the pipeline, even when later stages report
 * success. The earliest failing stage in submission order is the primary
 * cause; the others are attached as context.
 */

#include "dtx/core/cancel_token.hpp"
#include "dtx/core/result.hpp"
#include "dtx/pipeline/pipeline_spec.hpp"
#include "dtx/process/child_process.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dtx::pipeline {

enum class PipelineResult {
    Completed,
    Failed,
    Cancelled
};

const char* to_string(PipelineResult result) noexcept;

struct StageExit {
    std::string name;
    StageRole role = StageRole::Producer;
    process::ExitStatus status;
    std::string diagnostics;   ///< Captured stderr (meter: non-numeric lines only)
};

struct PipelineOutcome {
    PipelineResult result = PipelineResult::Completed;
    std::vector<StageExit> stages;   ///< Submission order; empty if spawning never finished
    std::optional<Error> error;      ///< Set unless Completed
};

struct RunnerOptions {
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds termination_grace{2000};
    std::size_t max_diagnostic_bytes = 64 * 1024;
};

class PipelineRunner {
public:
    using ChunkHandler = std::function<void(std::string_view)>;
    using StartedHandler = std::function<void()>;

    explicit PipelineRunner(RunnerOptions options = {});
    virtual ~PipelineRunner() = default;

    /**
     * @brief Execute the pipeline
     *
     * PARAMETERS:
     * spec        - validated again before anything is spawned
     * cancel      - observed at every poll tick
     * on_progress - raw chunks of the meter's progress channel, called on
     *               the calling thread
     * on_started  - called once, after all stages were spawned
     */
    virtual PipelineOutcome run(const PipelineSpec& spec,
                                const CancelToken& cancel,
                                const ChunkHandler& on_progress,
                                const StartedHandler& on_started = {}) const;

    const RunnerOptions& options() const noexcept { return options_; }

private:
    std::optional<PipelineOutcome> run_setup(const PipelineSpec& spec, const CancelToken& cancel) const;

    RunnerOptions options_;
};

} // namespace dtx::pipeline
