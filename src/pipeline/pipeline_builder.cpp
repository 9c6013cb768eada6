#include "dtx/pipeline/pipeline_builder.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <sstream>

namespace dtx::pipeline {
namespace fs = std::filesystem;

namespace {

std::string strip_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

PipelineBuilder::PipelineBuilder(const core::TransferConfig& config, const device::DeviceTransport& transport)
    : config_(config),
      transport_(transport),
      remote_root_(strip_trailing_slashes(fs::path(config.remote_root).lexically_normal().generic_string())) {
}

Result<std::string> PipelineBuilder::resolve_remote_path(const std::string& remote_path) const {
    if (remote_path.empty()) {
        return Ok(remote_root_);
    }

    fs::path candidate(remote_path);
    if (candidate.is_relative()) {
        candidate = fs::path(remote_root_) / candidate;
    }
    const std::string normalized = strip_trailing_slashes(candidate.lexically_normal().generic_string());

    if (normalized != remote_root_ && normalized.rfind(remote_root_ + "/", 0) != 0) {
        return Fail<std::string>(ErrorKind::PathInvalid,
                                 "remote path '" + remote_path + "' is outside the transfer root " + remote_root_);
    }
    return Ok(normalized);
}

Result<std::string> PipelineBuilder::resolve_local_path(const std::string& local_path) const {
    if (local_path.empty()) {
        return Fail<std::string>(ErrorKind::PathInvalid, "local path is empty");
    }
    std::error_code ec;
    const fs::path absolute = fs::absolute(local_path, ec);
    if (ec) {
        return Fail<std::string>(ErrorKind::PathInvalid,
                                 "cannot resolve local path '" + local_path + "': " + ec.message());
    }
    return Ok(strip_trailing_slashes(absolute.lexically_normal().string()));
}

StageSpec PipelineBuilder::meter_stage(std::optional<std::uint64_t> total_bytes) const {
    std::ostringstream interval;
    interval << config_.meter_interval_s;

    StageSpec meter;
    meter.name = "meter";
    meter.role = StageRole::Meter;
    meter.argv = {config_.pv_path, "-n", "-b", "-i", interval.str()};
    if (total_bytes && *total_bytes > 0) {
        meter.argv.push_back("-s");
        meter.argv.push_back(std::to_string(*total_bytes));
    }
    meter.stdin_mode = StreamMode::PipeIn;
    meter.stdout_mode = StreamMode::PipeOut;
    meter.stderr_mode = StreamMode::PipeOut;
    return meter;
}

Result<PipelineSpec> PipelineBuilder::build(transfer::Direction direction,
                                            const std::string& local_path,
                                            const std::string& remote_path,
                                            std::optional<std::uint64_t> total_bytes) const {
    auto local = resolve_local_path(local_path);
    if (local.is_error()) {
        return Err<PipelineSpec>(local.error());
    }
    auto remote = resolve_remote_path(remote_path);
    if (remote.is_error()) {
        return Err<PipelineSpec>(remote.error());
    }

    PipelineSpec spec = (direction == transfer::Direction::Pull)
        ? build_pull(local.value(), remote.value(), total_bytes)
        : build_push(local.value(), remote.value(), total_bytes);

    if (auto valid = spec.validate(); valid.is_error()) {
        return Err<PipelineSpec>(valid.error());
    }
    spdlog::debug("Built {} pipeline: {}", transfer::to_string(direction), spec.describe());
    return Ok(std::move(spec));
}

PipelineSpec PipelineBuilder::build_pull(const std::string& local, const std::string& remote,
                                         std::optional<std::uint64_t> total_bytes) const {
    const fs::path source(remote);
    std::string parent = source.parent_path().generic_string();
    if (parent.empty()) {
        parent = "/";
    }
    const std::string name = source.filename().generic_string();

    PipelineSpec spec;
    spec.setup.push_back(CommandSpec{"create-local-destination", {config_.mkdir_path, "-p", local}});

    // cd first: device tar builds differ in how they handle -C on create
    StageSpec producer;
    producer.name = "remote-archive";
    producer.role = StageRole::Producer;
    producer.argv = transport_.exec_out_argv(
        "cd " + device::shell_quote(parent) + " && tar -c -f - " + device::shell_quote(name));
    producer.stdin_mode = StreamMode::Null;
    producer.stdout_mode = StreamMode::PipeOut;

    StageSpec consumer;
    consumer.name = "local-extract";
    consumer.role = StageRole::Consumer;
    consumer.argv = {config_.tar_path, "-x", "-f", "-", "-C", local};
    consumer.stdin_mode = StreamMode::PipeIn;
    consumer.stdout_mode = StreamMode::Null;

    spec.stages = {producer, meter_stage(total_bytes), consumer};
    return spec;
}

PipelineSpec PipelineBuilder::build_push(const std::string& local, const std::string& remote,
                                         std::optional<std::uint64_t> total_bytes) const {
    PipelineSpec spec;
    spec.setup.push_back(CommandSpec{"create-remote-destination",
                                     transport_.shell_argv("mkdir -p " + device::shell_quote(remote))});

    StageSpec producer;
    producer.name = "local-archive";
    producer.role = StageRole::Producer;
    producer.argv = {config_.tar_path, "-c", "-f", "-", "-C", local, "."};
    producer.stdin_mode = StreamMode::Null;
    producer.stdout_mode = StreamMode::PipeOut;

    StageSpec consumer;
    consumer.name = "remote-extract";
    consumer.role = StageRole::Consumer;
    consumer.argv = transport_.shell_argv("tar -x -f - -C " + device::shell_quote(remote));
    consumer.stdin_mode = StreamMode::PipeIn;
    consumer.stdout_mode = StreamMode::Null;

    spec.stages = {producer, meter_stage(total_bytes), consumer};
    return spec;
}

} // namespace dtx::pipeline
