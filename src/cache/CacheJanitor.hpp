#ifndef CACHEJANITOR_HPP
#define CACHEJANITOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Periodically invokes a sweep callback from the io_context, independent of
// cache traffic. Once stop() has returned the callback is never invoked again,
// so the owner may be destroyed right after.
class CacheJanitor : public std::enable_shared_from_this<CacheJanitor> {
public:
    using SweepFn = std::function<void()>;

    static std::shared_ptr<CacheJanitor> create(net::io_context& ioc,
                                                std::chrono::milliseconds interval,
                                                SweepFn sweep,
                                                std::shared_ptr<ILogger> logger);
    ~CacheJanitor();

    void start();
    // Re-arms the timer with a new interval. Pending ticks of the old interval are dropped.
    void restart(std::chrono::milliseconds interval);
    void stop();

    bool isRunning() const;
    std::chrono::milliseconds interval() const;
    std::uint64_t sweepCount() const;

private:
    CacheJanitor(net::io_context& ioc,
                 std::chrono::milliseconds interval,
                 SweepFn sweep,
                 std::shared_ptr<ILogger> logger);

    void armLocked();
    void cancelLocked();
    void onTick(const boost::system::error_code& ec, std::uint64_t generation);

    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;

    // Guards everything below and the timer. Held while the sweep runs.
    mutable std::mutex mutex_;
    SweepFn sweep_;
    std::chrono::milliseconds interval_;
    std::uint64_t generation_ = 0;
    std::uint64_t sweep_count_ = 0;
    bool running_ = false;
    bool stopped_ = false;

    CacheJanitor(const CacheJanitor&) = delete;
    CacheJanitor& operator=(const CacheJanitor&) = delete;
};

#endif // CACHEJANITOR_HPP
