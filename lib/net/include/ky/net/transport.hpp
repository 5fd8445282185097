/*
Module Name:
- transport.hpp

Abstract:
- Capability the execution engine uses to put requests on the wire.
- execute() is a blocking single call. submit()/in_flight()/poll() form a
  multiplexed interface: many submitted calls progress concurrently while the
  caller polls, and completions run on the polling thread inside poll().
- Transport failures are reported in Response::error, never thrown.
  Exceptions escaping poll() or execute() are bugs or resource exhaustion.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <functional>

// Project
#include <ky/net/message.hpp>

namespace ky::net
{

    class Transport
    {
    public:
        using Completion = std::function<void(Response)>;

        Transport() = default;
        virtual ~Transport() = default;
        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;
        Transport(Transport&&) = delete;
        Transport& operator=(Transport&&) = delete;

        // Perform one call and block until it completes.
        [[nodiscard]] virtual Response execute(const Request& request) = 0;

        // Start a call; on_complete runs exactly once from a later poll().
        virtual void submit(Request request, Completion on_complete) = 0;

        // Calls submitted but not yet completed.
        [[nodiscard]] virtual std::size_t in_flight() const noexcept = 0;

        // Make progress and deliver completions, blocking at most max_wait.
        // Returns early once nothing is in flight.
        virtual void poll(std::chrono::milliseconds max_wait) = 0;
    };

} // namespace ky::net
