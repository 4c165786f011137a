#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"

namespace continuity::session {

// Serializes outbound frames onto the protocol stream, one JSON object per line.
// Concurrent writers never interleave bytes.
class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out);

    // Returns the number of bytes written including the newline.
    core::errors::Result<std::size_t> write(const nlohmann::json& frame);

    std::size_t frames_written() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::size_t frames_written_ = 0;
};

}  // namespace continuity::session
