#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace net = boost::asio;
using udp = net::ip::udp;

// Buffers StatsD lines and ships them in batches over UDP from the io_context.
// Callers never block on the network: send() only appends to the buffer.
class StatsDClient : public IStatsDClient, public std::enable_shared_from_this<StatsDClient> {
public:
    // stats_server_endpoint is "<host>:<port>". Throws std::runtime_error when it is
    // malformed or cannot be resolved.
    static std::shared_ptr<StatsDClient> create(
        net::io_context& ioc,
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    // Arms the periodic flush timer.
    void start();
    // Cancels the timer and flushes whatever is still buffered. Idempotent.
    void stop();

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::microseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    // Lines discarded because the buffer was full.
    std::size_t droppedLines() const;

private:
    StatsDClient(
        net::io_context& ioc,
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    void send(const std::string& message);
    void postFlush();
    void flush();
    void armFlushTimer();

    std::shared_ptr<ILogger> logger_;
    net::strand<net::io_context::executor_type> strand_;
    udp::socket socket_;
    udp::endpoint endpoint_;
    net::steady_timer flush_timer_;
    const std::size_t batch_size_;
    const std::chrono::milliseconds send_interval_;
    const std::size_t max_buffered_lines_;

    mutable std::mutex buffer_mutex_;
    std::vector<std::string> buffer_;
    std::size_t dropped_lines_ = 0;
    bool overflow_warned_ = false;
    bool stopped_ = false;

    // Delete copy and move operations
    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
