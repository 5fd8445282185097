// GSL
#include <gsl/gsl>

// Project
#include <ky/http/attempt.hpp>

namespace ky::http {

std::string_view to_string(AttemptState s) noexcept
{
    switch (s) {
    case AttemptState::pending:   return "pending";
    case AttemptState::in_flight: return "in_flight";
    case AttemptState::accepted:  return "accepted";
    case AttemptState::exhausted: return "exhausted";
    }
    return "unknown";
}

AttemptRecord::AttemptRecord(std::size_t max_attempts) noexcept
    : max_attempts_{max_attempts}
{
    Expects(max_attempts_ > 0);
}

void AttemptRecord::begin()
{
    Expects(state_ == AttemptState::pending);
    Expects(attempts_ < max_attempts_);
    ++attempts_;
    state_ = AttemptState::in_flight;
}

AttemptState AttemptRecord::settle(const net::Response& response)
{
    Expects(state_ == AttemptState::in_flight);

    if (!is_retryable(response)) {
        state_ = AttemptState::accepted;
    } else if (attempts_ >= max_attempts_) {
        state_ = AttemptState::exhausted;
    } else {
        state_ = AttemptState::pending;
    }

    Ensures(attempts_ <= max_attempts_);
    return state_;
}

} // namespace ky::http
