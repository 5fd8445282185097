/*
Module Name:
- hooks.hpp

Abstract:
- Capability interfaces for the optional per-request callbacks.
- BeforeHook runs before every attempt, AfterHook after every transport call.
- Hooks are shared by all copies of a RequestSpec, so one hook object observes
  every attempt of every copy. A null pointer means "no hook".
- HookInvoker is the only place the engine calls hooks. Exceptions thrown by a
  hook propagate unchanged and abort the attempt or round that triggered it.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <memory>

// Project
#include <ky/net/message.hpp>

namespace ky::http
{

    using net::Response;

    class RequestSpec;

    class BeforeHook
    {
    public:
        virtual ~BeforeHook() = default;
        virtual void before_request(const RequestSpec& spec) = 0;
    };

    class AfterHook
    {
    public:
        virtual ~AfterHook() = default;
        virtual void after_response(const Response& response) = 0;
    };

    using BeforeHookPtr = std::shared_ptr<BeforeHook>;
    using AfterHookPtr = std::shared_ptr<AfterHook>;

    // Adapters so callers can pass lambdas.
    [[nodiscard]] BeforeHookPtr make_before_hook(std::function<void(const RequestSpec&)> fn);
    [[nodiscard]] AfterHookPtr make_after_hook(std::function<void(const Response&)> fn);

    class HookInvoker
    {
    public:
        static void invoke_before(const RequestSpec& spec);
        static void invoke_after(const RequestSpec& spec, const Response& response);
    };

} // namespace ky::http
