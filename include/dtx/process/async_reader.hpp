#pragma once

#include "dtx/process/file_descriptor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string_view>

namespace dtx::process {

namespace asio = boost::asio;

/**
 * @brief Drains one pipe on an io_context until EOF
 *
 * Each chunk is handed to the data handler as soon as it arrives. Uses
 * enable_shared_from_this to stay alive while a read is pending.
 *
 * Lifecycle:
 * 1. Created with the read end of a pipe (takes ownership)
 * 2. start() queues the first async read
 * 3. Every completion delivers data and queues the next read
 * 4. EOF, error or close() marks the reader closed
 */
class AsyncReader : public std::enable_shared_from_this<AsyncReader> {
public:
    using DataHandler = std::function<void(std::string_view)>;

    AsyncReader(asio::io_context& io, FileDescriptor fd, DataHandler on_data);

    void start();

    /**
     * @brief Stop reading and close the descriptor; pending data is dropped
     */
    void close();

    bool closed() const noexcept { return closed_; }

private:
    void read_next();

    asio::posix::stream_descriptor stream_;
    std::array<char, 4096> buffer_{};
    DataHandler on_data_;
    bool closed_ = false;
};

} // namespace dtx::process
