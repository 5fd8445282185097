// C++ Standard Library
#include <iostream>
#include <memory>
#include <utility>

// Project
#include <ky/http/attempt.hpp>
#include <ky/http/batch_executor.hpp>
#include <ky/http/hooks.hpp>
#include <ky/utils/timer.hpp>

namespace ky::http {

struct BatchExecutor::Slot {
    std::size_t   index;
    RequestSpec   spec;
    net::Request  request; // built once, resubmitted on every attempt
    AttemptRecord record;
    Response      response;
};

std::vector<BatchResult> BatchExecutor::run_tagged(BatchQueue& queue)
{
    rounds_ = 0;

    std::vector<Slot> pending;
    {
        auto specs = queue.drain();
        pending.reserve(specs.size());
        for (std::size_t i = 0; i < specs.size(); ++i) {
            auto request = specs[i].to_request();
            const auto max_attempts = specs[i].max_attempts();
            pending.push_back(Slot{i, std::move(specs[i]), std::move(request), AttemptRecord{max_attempts}, {}});
        }
    }

    std::vector<BatchResult> out;
    out.reserve(pending.size());

    while (!pending.empty()) {
        ++rounds_;
        const ky::utils::Timer timer;
        const std::size_t submitted = pending.size();

        run_round(pending);

        std::vector<Slot> next;
        for (auto& slot : pending) {
            HookInvoker::invoke_after(slot.spec, slot.response);

            if (slot.record.settle(slot.response) == AttemptState::pending) {
                next.push_back(std::move(slot));
            } else {
                out.push_back(BatchResult{slot.index, slot.record.attempts(), std::move(slot.response)});
            }
        }

        if (options_.verbose) {
            std::cerr << "[BatchExecutor] round " << rounds_ << ": " << submitted << " submitted, "
                      << submitted - next.size() << " final, " << next.size() << " retrying ("
                      << timer.elapsed_count<std::chrono::milliseconds>() << "ms)\n";
        }

        pending = std::move(next);
    }

    return out;
}

std::vector<Response> BatchExecutor::run(BatchQueue& queue)
{
    auto tagged = run_tagged(queue);
    std::vector<Response> out;
    out.reserve(tagged.size());
    for (auto& r : tagged) {
        out.push_back(std::move(r.response));
    }
    return out;
}

std::vector<JsonResponse> BatchExecutor::run_json(BatchQueue& queue)
{
    const auto responses = run(queue);
    std::vector<JsonResponse> out;
    out.reserve(responses.size());
    for (const auto& r : responses) {
        out.push_back(to_json_response(r));
    }
    return out;
}

void BatchExecutor::run_round(std::vector<Slot>& pending)
{
    // Completions can still arrive while an exception unwinds this frame, so
    // they write into storage they co-own rather than into the slots.
    auto responses = std::make_shared<std::vector<Response>>(pending.size());

    try {
        for (std::size_t i = 0; i < pending.size(); ++i) {
            auto& slot = pending[i];
            HookInvoker::invoke_before(slot.spec);
            slot.record.begin();
            transport_->submit(slot.request, [responses, i](Response res) {
                (*responses)[i] = std::move(res);
            });
        }
    } catch (...) {
        // Finish what was already submitted so no later round sees it, then rethrow.
        settle_in_flight();
        throw;
    }

    settle_in_flight();

    for (std::size_t i = 0; i < pending.size(); ++i) {
        pending[i].response = std::move((*responses)[i]);
    }
}

void BatchExecutor::settle_in_flight()
{
    while (transport_->in_flight() > 0) {
        transport_->poll(options_.poll_interval);
    }
}

} // namespace ky::http
