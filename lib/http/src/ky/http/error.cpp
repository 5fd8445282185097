// C++ Standard Library
#include <utility>

// Project
#include <ky/http/error.hpp>

namespace ky::http {

RetriesExhausted::RetriesExhausted(unsigned retries, net::Response last_response)
    : std::runtime_error{"Request failed after " + std::to_string(retries) + " retries"}
    , retries_{retries}
    , last_response_{std::move(last_response)}
{
}

} // namespace ky::http
