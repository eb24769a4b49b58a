// tests/test_statsd_client.cpp
#include <array>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "mocks/Mocks.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/metrics/StatsDClient.hpp"

using ::testing::HasSubstr;
using ::testing::NiceMock;

class StatsDClientTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc_;
    udp::socket receiver_{ioc_, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    std::array<char, 2048> buffer_{};
    udp::endpoint sender_;
    std::string received_;
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();

    std::string endpoint() const {
        return "127.0.0.1:" + std::to_string(receiver_.local_endpoint().port());
    }

    void receiveOne() {
        receiver_.async_receive_from(boost::asio::buffer(buffer_), sender_,
            [this](const boost::system::error_code& ec, std::size_t bytes) {
                if (!ec) {
                    received_.assign(buffer_.data(), bytes);
                }
                ioc_.stop();
            });
    }
};

TEST_F(StatsDClientTest, FullBatchIsSentAsOneDatagram) {
    AppConfig config;
    config.metrics_batch_size = 3;
    config.metrics_send_interval_in_millis = 60000;
    auto client = StatsDClient::create(ioc_, config, logger_, endpoint());

    receiveOne();
    client->increment(MetricsDefinitions::CACHE_HIT);
    client->gauge(MetricsDefinitions::CACHE_ENTRIES, 7);
    client->timing(MetricsDefinitions::CACHE_LOOKUP_TIME, std::chrono::microseconds(1500));

    ioc_.run_for(std::chrono::seconds(2));

    EXPECT_EQ(received_, "query_cache.hit:1|c\nquery_cache.entries:7|g\nquery_cache.lookup_time:1.5|ms");
}

TEST_F(StatsDClientTest, PartialBatchIsFlushedByTimer) {
    AppConfig config;
    config.metrics_batch_size = 100;
    config.metrics_send_interval_in_millis = 20;
    auto client = StatsDClient::create(ioc_, config, logger_, endpoint());
    client->start();

    receiveOne();
    client->decrement(MetricsDefinitions::CACHE_ENTRIES, 2);

    ioc_.run_for(std::chrono::seconds(2));

    EXPECT_EQ(received_, "query_cache.entries:-2|c");
    client->stop();
}

TEST_F(StatsDClientTest, StopFlushesBufferedLines) {
    AppConfig config;
    config.metrics_batch_size = 100;
    config.metrics_send_interval_in_millis = 60000;
    auto client = StatsDClient::create(ioc_, config, logger_, endpoint());

    receiveOne();
    client->set("query_cache.connections", "conn1");
    client->stop();
    client->increment("dropped.after.stop");

    ioc_.run_for(std::chrono::seconds(2));

    EXPECT_EQ(received_, "query_cache.connections:conn1|s");
}

TEST_F(StatsDClientTest, BufferIsCappedWhileIoContextIsStalled) {
    AppConfig config;
    config.metrics_batch_size = 2;
    config.metrics_send_interval_in_millis = 60000;
    auto client = StatsDClient::create(ioc_, config, logger_, endpoint());

    EXPECT_CALL(*logger_, warn(HasSubstr("buffer full"))).Times(1);

    // Nothing runs the io_context, so posted flushes never drain the buffer.
    for (int i = 0; i < 20; ++i) {
        client->increment(MetricsDefinitions::CACHE_MISS);
    }
    EXPECT_EQ(client->droppedLines(), 12u);

    receiveOne();
    ioc_.run_for(std::chrono::seconds(2));

    std::string expected = "query_cache.miss:1|c";
    for (int i = 1; i < 8; ++i) {
        expected += "\nquery_cache.miss:1|c";
    }
    EXPECT_EQ(received_, expected);
}

TEST_F(StatsDClientTest, RejectsEndpointWithoutPort) {
    AppConfig config;
    EXPECT_THROW(StatsDClient::create(ioc_, config, logger_, "localhost"), std::runtime_error);
}
