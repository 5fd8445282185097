/*
Module Name:
- batch_queue.hpp

Abstract:
- Caller-owned, ordered collection of RequestSpecs waiting for a batch run.
- Append-only until drained; drain() empties the queue and hands its contents
  to the caller. The same spec may be added several times, each copy is an
  independent request.
- Not synchronised: do not add to a queue while BatchExecutor::run is using it.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <vector>

// Project
#include <ky/http/request_spec.hpp>

namespace ky::http
{

    class BatchQueue
    {
    public:
        BatchQueue() = default;

        void add(RequestSpec spec);

        [[nodiscard]] std::size_t size() const noexcept
        {
            return specs_.size();
        }
        [[nodiscard]] bool empty() const noexcept
        {
            return specs_.empty();
        }

        // Take every queued spec, leaving the queue empty.
        [[nodiscard]] std::vector<RequestSpec> drain() noexcept;

        void clear() noexcept
        {
            specs_.clear();
        }

    private:
        std::vector<RequestSpec> specs_;
    };

} // namespace ky::http
