#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

namespace minihttp::utility {
/// @brief Stop flag shared between the owner and the running thread, true means "exit now".
using runnerint_t = std::shared_ptr<std::atomic<bool>>;

/// @brief Raises stop flag and joins the thread when runner is destroyed or reset().
struct TStopAndJoin
{
    runnerint_t stop;

    void operator()(std::thread *thread) const
    {
        stop->store(true);
        if (thread && thread->joinable())
        {
            thread->join();
        }
        delete thread; // NOLINT
    }
};

/// @brief Owns exactly 1 running thread.
using runner_t = std::unique_ptr<std::thread, TStopAndJoin>;

/// @brief Executes @p func in the new thread. Used by background accept loops.
/// @param func - callable which accepts runnerint_t and returns once the flag becomes true.
template <typename taCallable>
runner_t startNewRunner(taCallable &&func)
{
    static_assert(std::is_invocable_v<taCallable, runnerint_t>,
                  "Callable should be invocable with runnerint_t as parameter");

    auto stop = std::make_shared<std::atomic<bool>>(false);
    auto *thread = new std::thread(std::forward<taCallable>(func), stop); // NOLINT
    return runner_t(thread, TStopAndJoin{std::move(stop)});
}
} // namespace minihttp::utility
