/*
Module Name:
- error.hpp

Abstract:
- Exceptions raised by the execution engine.
- RetriesExhausted is thrown only by SingleRequestExecutor. BatchExecutor hands
  back the last failing Response instead.
*/
#pragma once

// C++ Standard Library
#include <stdexcept>
#include <string>

// Project
#include <ky/net/message.hpp>

namespace ky::http
{

    class RetriesExhausted final : public std::runtime_error
    {
    public:
        RetriesExhausted(unsigned retries, net::Response last_response);

        // Configured retry budget (attempts made = retries() + 1).
        [[nodiscard]] unsigned retries() const noexcept
        {
            return retries_;
        }
        [[nodiscard]] const net::Response& last_response() const noexcept
        {
            return last_response_;
        }

    private:
        unsigned retries_;
        net::Response last_response_;
    };

} // namespace ky::http
