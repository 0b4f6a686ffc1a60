#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace CONCURRENCY {
namespace asio = boost::asio;

class Timer {
public:
    Timer(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb);
    void cancel();
    ~Timer();

    // non-copyable, but shareable via shared_ptr<Timer>
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

/**
 * @brief Thread pool over one asio::io_context.
 *
 * Exceptions escaping a posted task are logged and the worker keeps running.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(size_t threads = std::thread::hardware_concurrency());
    ~EventDispatcher();

    // Post immediate task
    void dispatch(std::function<void()> f);

    // Post delayed task (returns shared_ptr to Timer to allow cancel)
    [[nodiscard]] std::shared_ptr<Timer> dispatch_delayed(std::chrono::steady_clock::duration dur, std::function<void()> f);

    // ينتظر المهام الجارية فقط؛ المهام في الطابور تُهمل
    void stop();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace CONCURRENCY
