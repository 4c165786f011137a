#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include "core/errors/continuity_errors.hpp"

namespace continuity::session {

// In-flight JSON-RPC ids. Every begin() is paired with exactly one finish(), so
// no request is answered twice and a reused id cannot overtake its predecessor.
class RequestTracker {
public:
    core::errors::Result<std::size_t> begin(const std::string& id_key);
    core::errors::Result<std::size_t> finish(const std::string& id_key);

    bool in_flight(const std::string& id_key) const;
    std::size_t in_flight_count() const;
    std::size_t answered_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> in_flight_;
    std::size_t answered_ = 0;
};

}  // namespace continuity::session
