/*
Module Name:
- batch_executor.hpp

Abstract:
- Runs every request of a BatchQueue concurrently over one Transport, in rounds.
- A round submits all pending requests, polls the transport until nothing is in
  flight, then runs the after hooks and triages each response: retryable ones
  (status >= 500 or transport failure) with budget left go to the next round,
  the rest are final.
- Exhausted requests are returned like any other result. Unlike
  SingleRequestExecutor, nothing is thrown when retries run out.

Ordering:
- Results appear in the order their rounds finished: everything final after
  round 1, then round 2, and so on. Within a round they keep enqueue order.
  BatchResult::index maps a result back to its queue position.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <vector>

// Project
#include <ky/http/batch_queue.hpp>
#include <ky/http/executor_options.hpp>
#include <ky/http/json.hpp>
#include <ky/net/transport.hpp>

namespace ky::http
{

    struct BatchResult
    {
        std::size_t index{ 0 }; // position in the drained queue
        std::size_t attempts{ 0 };
        Response response;
    };

    class BatchExecutor
    {
    public:
        explicit BatchExecutor(net::Transport& transport, ExecutorOptions options = {}) noexcept
            :
            transport_{ &transport }, options_{ options }
        {
        }

        // Drain queue and run it. The queue is empty afterwards even if a hook throws.
        [[nodiscard]] std::vector<BatchResult> run_tagged(BatchQueue& queue);

        // run_tagged() without the tags.
        [[nodiscard]] std::vector<Response> run(BatchQueue& queue);

        // run() with each body decoded; undecodable bodies become std::nullopt.
        [[nodiscard]] std::vector<JsonResponse> run_json(BatchQueue& queue);

        // Rounds used by the most recent run.
        [[nodiscard]] std::size_t rounds() const noexcept
        {
            return rounds_;
        }

    private:
        struct Slot;

        void run_round(std::vector<Slot>& pending);
        void settle_in_flight();

        net::Transport* transport_; // non-null
        ExecutorOptions options_;
        std::size_t rounds_{ 0 };
    };

} // namespace ky::http
