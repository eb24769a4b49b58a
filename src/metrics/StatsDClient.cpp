#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>

#include "StatsDClient.hpp"

namespace {
    // Keeps a batched datagram inside a typical Ethernet MTU.
    constexpr std::size_t MAX_PACKET_BYTES = 1432;
    // Lines held while the io_context is not draining the buffer.
    constexpr std::size_t MAX_BUFFERED_BATCHES = 4;
}

std::shared_ptr<StatsDClient> StatsDClient::create(
    net::io_context& ioc,
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    return std::shared_ptr<StatsDClient>(new StatsDClient(ioc, config, logger, stats_server_endpoint));
}

StatsDClient::StatsDClient(
    net::io_context& ioc,
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address)
    : logger_(logger),
      strand_(net::make_strand(ioc)),
      socket_(strand_),
      flush_timer_(strand_),
      batch_size_(config.metrics_batch_size > 0 ? static_cast<std::size_t>(config.metrics_batch_size) : 1),
      send_interval_(config.metrics_send_interval_in_millis > 0 ? config.metrics_send_interval_in_millis : 1000),
      max_buffered_lines_(batch_size_ * MAX_BUFFERED_BATCHES) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }

    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }
    std::string port = statsd_address.substr(colon_pos + 1);

    boost::system::error_code ec;
    udp::resolver resolver(ioc);
    auto results = resolver.resolve(host, port, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Unable to resolve STATSD_SERVER " + statsd_address + ": " + ec.message());
    }
    endpoint_ = results.begin()->endpoint();

    socket_.open(endpoint_.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD UDP socket: " + ec.message());
    }
    buffer_.reserve(batch_size_);
    logger_->setup("StatsDClient sending to " + endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port()));
}

StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::start() {
    auto self = shared_from_this();
    net::post(strand_, [self]() { self->armFlushTimer(); });
}

void StatsDClient::stop() {
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    auto self = shared_from_this();
    net::post(strand_, [self]() {
        boost::system::error_code ec;
        self->flush_timer_.cancel(ec);
        if (ec) {
            self->logger_->warn("StatsDClient: failed to cancel flush timer: " + ec.message());
        }
        self->flush();
    });
}

void StatsDClient::armFlushTimer() {
    flush_timer_.expires_after(send_interval_);
    auto self = shared_from_this();
    flush_timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        self->flush();
        {
            std::lock_guard<std::mutex> lock(self->buffer_mutex_);
            if (self->stopped_) {
                return;
            }
        }
        self->armFlushTimer();
    });
}

// Buffer one line; hand a full batch to the io_context.
void StatsDClient::send(const std::string& message) {
    bool batch_full = false;
    bool warn_overflow = false;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (stopped_) {
            return;
        }
        if (buffer_.size() >= max_buffered_lines_) {
            ++dropped_lines_;
            warn_overflow = !overflow_warned_;
            overflow_warned_ = true;
        } else {
            buffer_.push_back(message);
            batch_full = buffer_.size() >= batch_size_;
        }
    }
    if (warn_overflow) {
        logger_->warn("StatsDClient buffer full (" + std::to_string(max_buffered_lines_) +
                      " lines); dropping metrics until the next flush");
    }
    if (batch_full) {
        postFlush();
    }
}

void StatsDClient::postFlush() {
    auto self = shared_from_this();
    net::post(strand_, [self]() { self->flush(); });
}

// Runs on the strand only.
void StatsDClient::flush() {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        lines.swap(buffer_);
        buffer_.reserve(batch_size_);
        overflow_warned_ = false;
    }
    if (lines.empty()) {
        return;
    }

    std::vector<std::string> packets;
    std::string packet;
    for (const auto& line : lines) {
        if (!packet.empty() && packet.size() + 1 + line.size() > MAX_PACKET_BYTES) {
            packets.push_back(std::move(packet));
            packet.clear();
        }
        if (!packet.empty()) {
            packet += '\n';
        }
        packet += line;
    }
    packets.push_back(std::move(packet));

    for (const auto& datagram : packets) {
        boost::system::error_code ec;
        socket_.send_to(net::buffer(datagram), endpoint_, 0, ec);
        if (ec) {
            logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
        }
    }
}

std::size_t StatsDClient::droppedLines() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return dropped_lines_;
}

// Increment a counter
void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

// Record a gauge value
void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

// Record a timing value, in fractional milliseconds
void StatsDClient::timing(const std::string& key, std::chrono::microseconds value) {
    std::stringstream ss;
    ss << key << ":" << (static_cast<double>(value.count()) / 1000.0) << "|ms";
    send(ss.str());
}

// Record a set value
void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
