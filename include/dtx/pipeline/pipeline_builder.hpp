#pragma once

#include "dtx/core/config.hpp"
#include "dtx/core/result.hpp"
#include "dtx/device/transport.hpp"
#include "dtx/pipeline/pipeline_spec.hpp"
#include "dtx/transfer/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dtx::pipeline {

/**
 * @brief Produces the archiver -> meter -> archiver process graph
 *
 * Pull: remote tar (via exec-out) | pv | local tar -x
 * Push: local tar -c | pv | remote tar -x (via shell)
 *
 * Destination directories are created by setup commands (mkdir -p), so a
 * second transfer into the same place is not an error.
 */
class PipelineBuilder {
public:
    PipelineBuilder(const core::TransferConfig& config, const device::DeviceTransport& transport);
    virtual ~PipelineBuilder() = default;

    /**
     * @brief Build and validate the spec for one transfer
     *
     * For Pull, remote_path is the source directory and local_path the
     * destination; for Push the other way round. Fails with PathInvalid when
     * the remote path escapes the transfer root or the local path is empty.
     */
    virtual Result<PipelineSpec> build(transfer::Direction direction,
                                       const std::string& local_path,
                                       const std::string& remote_path,
                                       std::optional<std::uint64_t> total_bytes) const;

    /**
     * @brief Map a caller-supplied remote path onto the transfer root
     *
     * "" -> root, "Photos" -> root/Photos, "/sdcard/Transfer/x" -> itself,
     * anything outside the root -> PathInvalid.
     */
    Result<std::string> resolve_remote_path(const std::string& remote_path) const;

    StageSpec meter_stage(std::optional<std::uint64_t> total_bytes) const;

    const std::string& remote_root() const noexcept { return remote_root_; }

private:
    Result<std::string> resolve_local_path(const std::string& local_path) const;

    PipelineSpec build_pull(const std::string& local, const std::string& remote,
                            std::optional<std::uint64_t> total_bytes) const;
    PipelineSpec build_push(const std::string& local, const std::string& remote,
                            std::optional<std::uint64_t> total_bytes) const;

    core::TransferConfig config_;
    const device::DeviceTransport& transport_;
    std::string remote_root_;
};

} // namespace dtx::pipeline
