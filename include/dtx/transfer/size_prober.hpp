#pragma once

/**
 * @file size_prober.hpp
 * @brief Total byte size of the source tree, measured before any data moves
 *
 * Pull measures on the device (du over the transport), Push walks the local
 * tree. Either way a failure is not fatal: the orchestrator falls back to a
 * transfer without percentage.
 */

#include "dtx/core/cancel_token.hpp"
#include "dtx/core/result.hpp"
#include "dtx/device/transport.hpp"
#include "dtx/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace dtx::transfer {

class SizeProber {
public:
    virtual ~SizeProber() = default;

    /**
     * @brief Size of the source side of a transfer
     *
     * Pull: path is the remote source. Push: path is the local source.
     * Errors are of kind SizeProbeFailed, or UserCancelled once cancel is
     * requested.
     */
    virtual Result<std::uint64_t> probe(Direction direction, const std::string& path,
                                        const CancelToken* cancel = nullptr) const = 0;
};

class DefaultSizeProber final : public SizeProber {
public:
    explicit DefaultSizeProber(const device::DeviceTransport& transport);

    Result<std::uint64_t> probe(Direction direction, const std::string& path,
                                const CancelToken* cancel = nullptr) const override;

    /**
     * @brief First whitespace-separated token of `du -s -b` output
     */
    static Result<std::uint64_t> parse_du_output(const std::string& output);

    /**
     * @brief Sum of regular file sizes below root; symlinks are neither
     *        followed nor counted
     *
     * The walk checks cancel before every entry.
     */
    static Result<std::uint64_t> local_tree_size(const std::filesystem::path& root,
                                                 const CancelToken* cancel = nullptr);

private:
    Result<std::uint64_t> probe_remote(const std::string& remote_path, const CancelToken* cancel) const;

    const device::DeviceTransport& transport_;
};

} // namespace dtx::transfer
