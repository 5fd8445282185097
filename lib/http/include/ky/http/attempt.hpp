/*
Module Name:
- attempt.hpp

Abstract:
- Retry state shared by the single-request and batch executors.
- An AttemptRecord lives for one execution of one RequestSpec and walks
      pending -> in_flight -> {accepted | pending | exhausted}
  begin() starts an attempt, settle() classifies its Response.
- A Response is retryable when the transport failed or the status is >= 500.
  Everything below 500, 4xx included, is accepted.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <string_view>

// Project
#include <ky/net/message.hpp>

namespace ky::http
{

    enum class AttemptState
    {
        pending,
        in_flight,
        accepted,
        exhausted,
    };

    [[nodiscard]] std::string_view to_string(AttemptState s) noexcept;

    inline constexpr int k_server_error_floor = 500;

    [[nodiscard]] inline bool is_retryable(const net::Response& response) noexcept
    {
        return response.transport_failed() || response.status >= k_server_error_floor;
    }

    class AttemptRecord
    {
    public:
        // max_attempts = retry budget + 1
        explicit AttemptRecord(std::size_t max_attempts) noexcept;

        // pending -> in_flight
        void begin();

        // in_flight -> accepted | pending | exhausted
        AttemptState settle(const net::Response& response);

        [[nodiscard]] std::size_t attempts() const noexcept
        {
            return attempts_;
        }
        [[nodiscard]] std::size_t max_attempts() const noexcept
        {
            return max_attempts_;
        }
        [[nodiscard]] AttemptState state() const noexcept
        {
            return state_;
        }
        [[nodiscard]] bool finished() const noexcept
        {
            return state_ == AttemptState::accepted || state_ == AttemptState::exhausted;
        }

    private:
        std::size_t max_attempts_;
        std::size_t attempts_{ 0 };
        AttemptState state_{ AttemptState::pending };
    };

} // namespace ky::http
