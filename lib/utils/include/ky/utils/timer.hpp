/*
Module Name:
- timer.hpp

Abstract:
- Monotonic stopwatch built on std::chrono::steady_clock.
- Used to report round and attempt durations in verbose engine logs.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <concepts>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace ky::utils
{

    template<class D>
    concept ChronoDuration = requires {
        typename std::remove_cvref_t<D>::rep;
        typename std::remove_cvref_t<D>::period;
    } && std::same_as<std::remove_cvref_t<D>,
                      std::chrono::duration<typename std::remove_cvref_t<D>::rep,
                                            typename std::remove_cvref_t<D>::period>>;

    class Timer
    {
    public:
        using clock = std::chrono::steady_clock;

        Timer() noexcept = default;

        void restart() noexcept
        {
            start_ = clock::now();
        }

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero());
            return d;
        }

        // Elapsed time as a count of D, e.g. elapsed_count<std::chrono::milliseconds>().
        template<ChronoDuration D>
        [[nodiscard]] auto elapsed_count() const noexcept -> typename std::remove_cvref_t<D>::rep
        {
            return std::chrono::duration_cast<std::remove_cvref_t<D>>(elapsed()).count();
        }

    private:
        clock::time_point start_ = clock::now();
    };

} // namespace ky::utils
