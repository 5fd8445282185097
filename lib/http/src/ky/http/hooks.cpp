// C++ Standard Library
#include <utility>

// Project
#include <ky/http/hooks.hpp>
#include <ky/http/request_spec.hpp>

namespace ky::http {

namespace {

    class FunctionBeforeHook final : public BeforeHook
    {
    public:
        explicit FunctionBeforeHook(std::function<void(const RequestSpec&)> fn) : fn_{std::move(fn)} {}
        void before_request(const RequestSpec& spec) override { fn_(spec); }

    private:
        std::function<void(const RequestSpec&)> fn_;
    };

    class FunctionAfterHook final : public AfterHook
    {
    public:
        explicit FunctionAfterHook(std::function<void(const Response&)> fn) : fn_{std::move(fn)} {}
        void after_response(const Response& response) override { fn_(response); }

    private:
        std::function<void(const Response&)> fn_;
    };

} // namespace

BeforeHookPtr make_before_hook(std::function<void(const RequestSpec&)> fn)
{
    if (!fn) {
        return nullptr;
    }
    return std::make_shared<FunctionBeforeHook>(std::move(fn));
}

AfterHookPtr make_after_hook(std::function<void(const Response&)> fn)
{
    if (!fn) {
        return nullptr;
    }
    return std::make_shared<FunctionAfterHook>(std::move(fn));
}

void HookInvoker::invoke_before(const RequestSpec& spec)
{
    if (const auto& hook = spec.before_hook()) {
        hook->before_request(spec);
    }
}

void HookInvoker::invoke_after(const RequestSpec& spec, const Response& response)
{
    if (const auto& hook = spec.after_hook()) {
        hook->after_response(response);
    }
}

} // namespace ky::http
