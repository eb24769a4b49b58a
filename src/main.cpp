#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp> // For graceful shutdown

#include <nlohmann/json.hpp>

#include "cache/QueryCache.hpp"
#include "config/AppConfig.hpp"
#include "core/CachedQueryRunner.hpp"
#include "core/FixtureQueryExecutor.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

struct ReplayTotals {
    std::size_t queries = 0;
    std::size_t served_from_cache = 0;
    std::size_t failures = 0;
    std::size_t invalidations = 0;
};

// Returns the real StatsDClient when STATSD_SERVER is set and usable, else the dummy.
std::shared_ptr<IStatsDClient> initializeStatsDClient(net::io_context& ioc,
                                                      const AppConfig& config,
                                                      std::shared_ptr<ILogger> logger_,
                                                      std::shared_ptr<StatsDClient>& real_client) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    try {
        if (!statsd_server_endpoint.empty()) {
            logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
            real_client = StatsDClient::create(ioc, config, logger_, statsd_server_endpoint);
            real_client->start();
            return real_client;
        }
        logger_->setup("STATSD_SERVER not set. Metrics are disabled.");
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()));
    }
    return DummyStatsDClient::getInstance();
}

// Parses one workload line into a request. Throws on malformed input.
QueryRequest parseWorkloadLine(const json& line) {
    QueryRequest request;
    request.connection_id = line.at("connection").get<std::string>();
    if (line.contains("query")) {
        request.query = line.at("query").get<std::string>();
    }
    if (line.contains("database") && !line.at("database").is_null()) {
        request.database = line.at("database").get<std::string>();
    }
    if (line.contains("params")) {
        request.params = line.at("params");
    }
    if (line.contains("ttl_ms")) {
        request.ttl = std::chrono::milliseconds(line.at("ttl_ms").get<long long>());
    }
    return request;
}

void replay(std::istream& workload,
            CachedQueryRunner& runner,
            QueryCache& cache,
            IStatsDClient& statsd_client,
            ILogger& logger,
            const std::atomic<bool>& stop_requested,
            ReplayTotals& totals) {
    std::string raw_line;
    std::size_t line_number = 0;
    while (!stop_requested && std::getline(workload, raw_line)) {
        ++line_number;
        raw_line = Utils::trim(raw_line);
        if (raw_line.empty() || raw_line[0] == '#') {
            continue;
        }
        try {
            const json line = json::parse(raw_line);
            const std::string op = line.value("op", std::string("query"));
            if (op == "clear_all") {
                cache.clearAll();
            } else if (op == "clear_connection") {
                totals.invalidations += runner.invalidateConnection(line.at("connection").get<std::string>());
            } else if (op == "query") {
                ++totals.queries;
                QueryResult result = runner.run(parseWorkloadLine(line));
                if (result.from_cache) {
                    ++totals.served_from_cache;
                }
            } else {
                logger.warn("Workload line " + std::to_string(line_number) + ": unknown op '" + op + "'");
            }
        } catch (const std::exception& e) {
            ++totals.failures;
            statsd_client.increment(MetricsDefinitions::CODE_EXCEPTION);
            logger.error("Workload line " + std::to_string(line_number) + ": " + e.what());
        }
    }
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        if (config_.fixtures_path.empty()) {
            logger_->error("Missing fixtures=<path> argument. Exiting.");
            return 1;
        }
        std::ifstream fixtures_file(config_.fixtures_path);
        if (!fixtures_file.is_open()) {
            logger_->error("Cannot open fixtures file " + config_.fixtures_path + ". Exiting.");
            return 1;
        }
        auto executor = std::make_shared<FixtureQueryExecutor>(fixtures_file, logger_);

        // --- Boost.Asio io_context for the janitor, metrics and signals ---
        net::io_context ioc;
        auto work_guard = net::make_work_guard(ioc);

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.num_io_threads) + " I/O threads for Boost.Asio.");
        for (unsigned int i = 0; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " started.");
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        std::shared_ptr<StatsDClient> real_statsd_client;
        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(ioc, config_, logger_, real_statsd_client);

        auto cache = std::make_shared<QueryCache>(ioc, config_.cacheConfig(), statsd_client, logger_);
        CachedQueryRunner runner(cache, executor, statsd_client, logger_);
        logger_->setup("QueryCache created");

        // Setup signal handling for graceful shutdown
        std::atomic<bool> stop_requested{false};
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&stop_requested, logger_](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            logger_->setup("Signal " + std::to_string(signal_number) + " received. Stopping replay...");
            stop_requested = true;
        });

        ReplayTotals totals;
        if (config_.workload_path.empty() || config_.workload_path == "-") {
            logger_->setup("Replaying workload from stdin.");
            replay(std::cin, runner, *cache, *statsd_client, *logger_, stop_requested, totals);
        } else {
            std::ifstream workload_file(config_.workload_path);
            if (!workload_file.is_open()) {
                logger_->error("Cannot open workload file " + config_.workload_path + ".");
            } else {
                logger_->setup("Replaying workload from " + config_.workload_path + ".");
                replay(workload_file, runner, *cache, *statsd_client, *logger_, stop_requested, totals);
            }
        }

        json report;
        report["queries"] = totals.queries;
        report["servedFromCache"] = totals.served_from_cache;
        report["executed"] = executor->executionCount();
        report["failures"] = totals.failures;
        report["invalidatedEntries"] = totals.invalidations;
        report["cache"] = cache->stats().to_json();
        std::cout << report.dump(2) << std::endl;

        // --- Shutdown: stop everything that keeps the io_context busy, then join ---
        cache->destroy();
        if (real_statsd_client) {
            real_statsd_client->stop();
        }
        boost::system::error_code cancel_ec;
        signals.cancel(cancel_ec);
        if (cancel_ec) {
            logger_->warn("Failed to cancel signal wait: " + cancel_ec.message());
        }
        work_guard.reset();
        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("All Boost.Asio I/O threads joined. Exiting.");
        return totals.failures == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
