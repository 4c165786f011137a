#include "session/response_writer.hpp"

#include <string>
#include "core/logging/logger.hpp"

namespace continuity::session {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;

ResponseWriter::ResponseWriter(std::ostream& out) : out_(out) {}

core::errors::Result<std::size_t> ResponseWriter::write(const json& frame) {
    // Compact dump never contains a raw newline; invalid UTF-8 is replaced.
    std::string line = frame.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.flush();
    if (!out_) {
        out_.clear();
        LOG_ERROR("ResponseWriter: failed to write " + std::to_string(line.size()) +
                  " bytes to the protocol stream");
        return ContinuityError{ErrorKind::Internal, "Failed to write response frame.",
                               "response_write_failed"};
    }
    ++frames_written_;
    return line.size();
}

std::size_t ResponseWriter::frames_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_written_;
}

}  // namespace continuity::session
