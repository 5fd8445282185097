/*
Module Name:
- single_request_executor.hpp

Abstract:
- Runs one RequestSpec to completion on the calling thread.
- Up to retry + 1 sequential attempts. Each attempt calls the before hook, the
  transport, then the after hook. The first accepted Response (no transport
  error, status < 500) is returned.
- When every attempt is rejected, throws RetriesExhausted.
*/
#pragma once

// C++ Standard Library
#include <optional>

// Project
#include <ky/http/executor_options.hpp>
#include <ky/http/json.hpp>
#include <ky/http/request_spec.hpp>
#include <ky/net/transport.hpp>

namespace ky::http
{

    class SingleRequestExecutor
    {
    public:
        explicit SingleRequestExecutor(net::Transport& transport, ExecutorOptions options = {}) noexcept
            :
            transport_{ &transport }, options_{ options }
        {
        }

        [[nodiscard]] Response send(const RequestSpec& spec);

        // send() and decode the body. std::nullopt when the body is not JSON.
        [[nodiscard]] std::optional<json> send_json(const RequestSpec& spec);

    private:
        net::Transport* transport_; // non-null
        ExecutorOptions options_;
    };

} // namespace ky::http
