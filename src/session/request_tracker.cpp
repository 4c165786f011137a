#include "session/request_tracker.hpp"

#include "core/logging/logger.hpp"

namespace continuity::session {

using core::errors::ContinuityError;
using core::errors::ErrorKind;

core::errors::Result<std::size_t> RequestTracker::begin(const std::string& id_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_flight_.insert(id_key).second) {
        return ContinuityError{ErrorKind::InvalidRequest,
                               "Request id " + id_key + " is already in flight",
                               "duplicate_request_id"};
    }
    return in_flight_.size();
}

core::errors::Result<std::size_t> RequestTracker::finish(const std::string& id_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.erase(id_key) == 0) {
        LOG_ERROR("RequestTracker: finish for unknown id " + id_key);
        return ContinuityError{ErrorKind::Internal,
                               "Request id " + id_key + " is not in flight",
                               "request_not_in_flight"};
    }
    ++answered_;
    return answered_;
}

bool RequestTracker::in_flight(const std::string& id_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(id_key) > 0;
}

std::size_t RequestTracker::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::size_t RequestTracker::answered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return answered_;
}

}  // namespace continuity::session
