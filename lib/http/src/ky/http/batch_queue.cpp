// C++ Standard Library
#include <utility>

// Project
#include <ky/http/batch_queue.hpp>

namespace ky::http {

void BatchQueue::add(RequestSpec spec)
{
    specs_.push_back(std::move(spec));
}

std::vector<RequestSpec> BatchQueue::drain() noexcept
{
    std::vector<RequestSpec> out;
    out.swap(specs_);
    return out;
}

} // namespace ky::http
