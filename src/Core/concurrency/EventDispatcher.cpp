#include "Core/concurrency/EventDispatcher.hpp"
#include "Utils/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace CONCURRENCY {

namespace {

void runGuarded(const std::function<void()>& task, const char* what) {
    try {
        task();
    } catch (const std::exception& e) {
        BoostLogger::Error("{} threw: {}", what, e.what());
    }
}

} // namespace

//
// Timer::Impl
//
struct Timer::Impl {
    asio::steady_timer timer;
    std::function<void()> cb;
    std::atomic<bool> cancelled{false};

    Impl(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb_)
        : timer(io, dur), cb(std::move(cb_)) {}

    void cancel() {
        cancelled.store(true);
        boost::system::error_code ec;
        timer.cancel(ec);
    }
};

Timer::Timer(asio::io_context& io, std::chrono::steady_clock::duration dur, std::function<void()> cb)
    : impl_(std::make_shared<Impl>(io, dur, std::move(cb)))
{
    // المؤقت يبقى حيا حتى ينتهي الانتظار
    impl_->timer.async_wait([self = impl_](const boost::system::error_code& ec) {
        if (ec || self->cancelled.load() || !self->cb) return;
        runGuarded(self->cb, "delayed task");
    });
}

void Timer::cancel() {
    if (impl_) impl_->cancel();
}

Timer::~Timer() {
    cancel();
}

//
// EventDispatcher::Impl
//
struct EventDispatcher::Impl {
    asio::io_context io_ctx;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;
    std::vector<std::thread> threads;
    size_t thread_count{1};
    std::atomic<bool> running{false};

    explicit Impl(size_t threads_count) : thread_count(threads_count) {}

    void run_threads() {
        if (running.exchange(true)) return;
        io_ctx.restart();
        work_guard.emplace(asio::make_work_guard(io_ctx));
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this]() {
                for (;;) {
                    try {
                        io_ctx.run();
                        return;
                    } catch (const std::exception& e) {
                        BoostLogger::Error("EventDispatcher worker: {}", e.what());
                    }
                }
            });
        }
    }

    void stop_threads() {
        if (!running.exchange(false)) return;
        work_guard.reset();
        io_ctx.stop();
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
    }
};

EventDispatcher::EventDispatcher(size_t threads)
    : impl_(std::make_unique<Impl>(threads == 0 ? 1 : threads))
{
    impl_->run_threads();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::dispatch(std::function<void()> f) {
    if (!f) return;
    asio::post(impl_->io_ctx, [task = std::move(f)]() { runGuarded(task, "task"); });
}

std::shared_ptr<Timer> EventDispatcher::dispatch_delayed(std::chrono::steady_clock::duration dur, std::function<void()> f) {
    if (!f) return nullptr;
    return std::make_shared<Timer>(impl_->io_ctx, dur, std::move(f));
}

void EventDispatcher::stop() {
    impl_->stop_threads();
}

} // namespace CONCURRENCY
