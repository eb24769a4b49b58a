#include "CacheJanitor.hpp"

#include <stdexcept>
#include <string>

#include <boost/system/system_error.hpp>

namespace {
    constexpr std::chrono::milliseconds MIN_INTERVAL{1};

    std::chrono::milliseconds clampInterval(std::chrono::milliseconds interval) {
        return interval < MIN_INTERVAL ? MIN_INTERVAL : interval;
    }
}

std::shared_ptr<CacheJanitor> CacheJanitor::create(net::io_context& ioc,
                                                   std::chrono::milliseconds interval,
                                                   SweepFn sweep,
                                                   std::shared_ptr<ILogger> logger) {
    return std::shared_ptr<CacheJanitor>(new CacheJanitor(ioc, interval, std::move(sweep), std::move(logger)));
}

CacheJanitor::CacheJanitor(net::io_context& ioc,
                           std::chrono::milliseconds interval,
                           SweepFn sweep,
                           std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)),
      timer_(ioc),
      sweep_(std::move(sweep)),
      interval_(clampInterval(interval)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CacheJanitor");
    }
    if (!sweep_) {
        throw std::invalid_argument("Sweep callback cannot be empty for CacheJanitor");
    }
}

CacheJanitor::~CacheJanitor() {
    stop();
}

void CacheJanitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || running_) {
        return;
    }
    running_ = true;
    armLocked();
    logger_->debug("CacheJanitor started with interval " + std::to_string(interval_.count()) + "ms");
}

void CacheJanitor::restart(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = clampInterval(interval);
    if (stopped_ || !running_) {
        return;
    }
    cancelLocked();
    armLocked();
    logger_->debug("CacheJanitor restarted with interval " + std::to_string(interval_.count()) + "ms");
}

void CacheJanitor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    running_ = false;
    cancelLocked();
    sweep_ = nullptr;
    logger_->debug("CacheJanitor stopped after " + std::to_string(sweep_count_) + " sweeps");
}

bool CacheJanitor::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::chrono::milliseconds CacheJanitor::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

std::uint64_t CacheJanitor::sweepCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweep_count_;
}

void CacheJanitor::armLocked() {
    const std::uint64_t generation = ++generation_;
    timer_.expires_after(interval_);
    // Weak: a janitor nobody owns any more should not be kept alive by its own timer.
    std::weak_ptr<CacheJanitor> weak_self = weak_from_this();
    timer_.async_wait([weak_self, generation](const boost::system::error_code& ec) {
        if (auto self = weak_self.lock()) {
            self->onTick(ec, generation);
        }
    });
}

void CacheJanitor::cancelLocked() {
    // Bumping the generation invalidates a tick that is already queued for execution.
    ++generation_;
    try {
        timer_.cancel();
    } catch (const boost::system::system_error& e) {
        logger_->error("CacheJanitor failed to cancel its timer: " + std::string(e.what()));
    }
}

void CacheJanitor::onTick(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || generation != generation_) {
        return;
    }
    if (ec) {
        logger_->warn("CacheJanitor timer error: " + ec.message());
    } else {
        try {
            sweep_();
        } catch (const std::exception& e) {
            logger_->error("CacheJanitor sweep failed: " + std::string(e.what()));
        }
        ++sweep_count_;
    }
    armLocked();
}
