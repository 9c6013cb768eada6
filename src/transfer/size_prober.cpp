#include "dtx/transfer/size_prober.hpp"
#include "dtx/core/format.hpp"
#include "dtx/progress/progress_parser.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <system_error>

namespace dtx::transfer {
namespace fs = std::filesystem;

namespace {

Error probe_error(const std::string& message, const std::string& diagnostics = {}) {
    Error error(ErrorKind::SizeProbeFailed, message);
    error.stage = "size-probe";
    error.diagnostics = diagnostics;
    return error;
}

Error probe_cancelled(const std::string& path) {
    Error error(ErrorKind::UserCancelled, "size probe of " + path + " cancelled");
    error.stage = "size-probe";
    return error;
}

} // namespace

DefaultSizeProber::DefaultSizeProber(const device::DeviceTransport& transport)
    : transport_(transport) {
}

Result<std::uint64_t> DefaultSizeProber::probe(Direction direction, const std::string& path,
                                               const CancelToken* cancel) const {
    auto result = (direction == Direction::Pull) ? probe_remote(path, cancel) : local_tree_size(path, cancel);
    if (result.is_ok()) {
        spdlog::info("Size probe ({}) {}: {}", to_string(direction), path, core::format_bytes(result.value()));
    }
    return result;
}

Result<std::uint64_t> DefaultSizeProber::probe_remote(const std::string& remote_path,
                                                      const CancelToken* cancel) const {
    auto result = transport_.run_shell("du -s -b " + device::shell_quote(remote_path), cancel);
    if (result.is_error()) {
        const auto& cause = result.error();
        if (cause.kind == ErrorKind::UserCancelled) {
            return Err<std::uint64_t>(probe_cancelled(remote_path));
        }
        return Err<std::uint64_t>(probe_error("remote du could not run: " + cause.describe(), cause.diagnostics));
    }

    const auto& output = result.value();
    if (!output.status.success()) {
        std::string diagnostics = output.stderr_text.empty() ? output.stdout_text : output.stderr_text;
        return Err<std::uint64_t>(probe_error("remote du failed with " + output.status.describe(), diagnostics));
    }
    return parse_du_output(output.stdout_text);
}

Result<std::uint64_t> DefaultSizeProber::parse_du_output(const std::string& output) {
    std::istringstream stream(output);
    std::string token;
    if (!(stream >> token)) {
        return Err<std::uint64_t>(probe_error("du printed nothing"));
    }
    auto bytes = progress::parse_byte_count(token);
    if (!bytes) {
        return Err<std::uint64_t>(probe_error("unexpected du output '" + token + "'", output));
    }
    return Ok(*bytes);
}

Result<std::uint64_t> DefaultSizeProber::local_tree_size(const fs::path& root, const CancelToken* cancel) {
    std::error_code ec;
    const auto root_status = fs::symlink_status(root, ec);
    if (ec) {
        return Err<std::uint64_t>(probe_error("cannot stat " + root.string() + ": " + ec.message()));
    }
    if (fs::is_regular_file(root_status)) {
        const auto size = fs::file_size(root, ec);
        if (ec) {
            return Err<std::uint64_t>(probe_error("cannot size " + root.string() + ": " + ec.message()));
        }
        return Ok(static_cast<std::uint64_t>(size));
    }
    if (!fs::is_directory(root_status)) {
        return Err<std::uint64_t>(probe_error(root.string() + " is not a directory"));
    }

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Err<std::uint64_t>(probe_error("cannot walk " + root.string() + ": " + ec.message()));
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (cancel && cancel->is_requested()) {
            return Err<std::uint64_t>(probe_cancelled(root.string()));
        }
        if (ec) {
            return Err<std::uint64_t>(probe_error("cannot walk " + root.string() + ": " + ec.message()));
        }
        const auto status = it->symlink_status(ec);
        if (ec) {
            return Err<std::uint64_t>(probe_error("cannot stat " + it->path().string() + ": " + ec.message()));
        }
        if (!fs::is_regular_file(status)) {
            continue;
        }
        const auto size = it->file_size(ec);
        if (ec) {
            return Err<std::uint64_t>(probe_error("cannot size " + it->path().string() + ": " + ec.message()));
        }
        total += size;
    }
    if (ec) {
        return Err<std::uint64_t>(probe_error("cannot walk " + root.string() + ": " + ec.message()));
    }
    return Ok(total);
}

} // namespace dtx::transfer
