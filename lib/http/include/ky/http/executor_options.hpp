/*
Module Name:
- executor_options.hpp

Abstract:
- Knobs shared by SingleRequestExecutor and BatchExecutor.
*/
#pragma once

// C++ Standard Library
#include <chrono>

namespace ky::http
{

    inline constexpr auto k_default_poll_interval = std::chrono::milliseconds{ 100 };

    struct ExecutorOptions
    {
        // Longest a batch round blocks in Transport::poll before re-checking.
        std::chrono::milliseconds poll_interval{ k_default_poll_interval };

        // Log attempts, retries and round summaries to std::cerr.
        bool verbose{ false };
    };

} // namespace ky::http
