// C++ Standard Library
#include <iostream>

// Project
#include <ky/http/attempt.hpp>
#include <ky/http/error.hpp>
#include <ky/http/hooks.hpp>
#include <ky/http/single_request_executor.hpp>
#include <ky/utils/timer.hpp>

namespace ky::http {

Response SingleRequestExecutor::send(const RequestSpec& spec)
{
    const net::Request request = spec.to_request();
    AttemptRecord record{spec.max_attempts()};
    Response last;

    while (!record.finished()) {
        HookInvoker::invoke_before(spec);
        record.begin();

        const ky::utils::Timer timer;
        last = transport_->execute(request);

        HookInvoker::invoke_after(spec, last);
        const AttemptState state = record.settle(last);

        if (options_.verbose) {
            std::cerr << "[SingleRequestExecutor] " << net::to_string(spec.method()) << ' '
                      << request.url << " attempt " << record.attempts() << '/'
                      << record.max_attempts() << " -> " << last.status;
            if (last.transport_failed()) {
                std::cerr << " (" << last.error.message() << ')';
            }
            std::cerr << " in " << timer.elapsed_count<std::chrono::milliseconds>() << "ms, "
                      << to_string(state) << '\n';
        }

        if (state == AttemptState::accepted) {
            return last;
        }
    }

    throw RetriesExhausted{spec.retry(), std::move(last)};
}

std::optional<json> SingleRequestExecutor::send_json(const RequestSpec& spec)
{
    const Response res = send(spec);
    return decode_json(res.body);
}

} // namespace ky::http
