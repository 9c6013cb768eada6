#include "dtx/process/async_reader.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

namespace dtx::process {

AsyncReader::AsyncReader(asio::io_context& io, FileDescriptor fd, DataHandler on_data)
    : stream_(io, fd.release()),
      on_data_(std::move(on_data)) {
}

void AsyncReader::start() {
    read_next();
}

void AsyncReader::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    boost::system::error_code ec;
    stream_.close(ec);
    if (ec) {
        spdlog::debug("Closing pipe reader: {}", ec.message());
    }
}

void AsyncReader::read_next() {
    if (closed_) {
        return;
    }
    auto self = shared_from_this();
    stream_.async_read_some(
        asio::buffer(buffer_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes) {
            if (bytes > 0 && on_data_) {
                on_data_(std::string_view(buffer_.data(), bytes));
            }
            if (ec) {
                if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                    spdlog::debug("Pipe read error: {}", ec.message());
                }
                close();
                return;
            }
            read_next();
        });
}

} // namespace dtx::process
