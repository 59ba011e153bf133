// AceProxy - AceStream Multiplexing Proxy
// Timeout Writer Implementation

#include "aceproxy/streaming/timeout_writer.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace aceproxy {
namespace streaming {

TimeoutWriter::TimeoutWriter(IStreamWriter& destination, std::chrono::milliseconds timeout)
    : destination_(destination)
    , timeout_(timeout) {
}

core::Result<size_t, core::Error> TimeoutWriter::write(const uint8_t* data, size_t size) {
    size_t offset = 0;

    while (offset < size) {
        if (destination_.supportsDeadline()) {
            destination_.setWriteDeadline(std::chrono::steady_clock::now() + timeout_);
        }

        auto result = destination_.write(data + offset, size - offset);
        if (result.isError()) {
            const core::Error& cause = result.error();
            std::string written = "bytes_written=" + std::to_string(offset);
            if (isTimeoutError(cause)) {
                return core::Result<size_t, core::Error>::error(
                    core::Error(core::ErrorCode::WriteTimeout,
                                "write timeout: " + cause.message, written));
            }
            return core::Result<size_t, core::Error>::error(
                core::Error(cause.code, cause.message, written));
        }

        size_t n = result.value();
        if (n == 0) {
            return core::Result<size_t, core::Error>::error(
                core::Error(core::ErrorCode::ShortWrite, "destination accepted no bytes",
                            "bytes_written=" + std::to_string(offset)));
        }
        offset += n;
        bytesWritten_.fetch_add(n);
    }

    return core::Result<size_t, core::Error>::success(size);
}

core::Result<void, core::Error> TimeoutWriter::flush() {
    if (destination_.supportsDeadline()) {
        destination_.setWriteDeadline(std::chrono::steady_clock::now() + timeout_);
    }
    auto result = destination_.flush();
    if (result.isError() && isTimeoutError(result.error())) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::WriteTimeout, "write timeout: " + result.error().message));
    }
    return result;
}

bool TimeoutWriter::isTimeoutError(const core::Error& error) {
    if (error.code == core::ErrorCode::Timeout || error.code == core::ErrorCode::WriteTimeout) {
        return true;
    }

    std::string lower = error.message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("timeout") != std::string::npos ||
           lower.find("deadline") != std::string::npos;
}

} // namespace streaming
} // namespace aceproxy
