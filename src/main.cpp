#include "Config.hpp"
#include "ConnectionStore.hpp"
#include "DriverFactory.hpp"
#include "ErrorHandler.hpp"
#include "MutationBuilder.hpp"
#include "PoolManager.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

using namespace dbbridge;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;
std::atomic<bool> g_finished{false};

void signalHandler(int signal) {
    g_signal_received = signal;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void setupLogging(const LoggingConfig& logging) {
    try {
        auto level = spdlog::level::from_str(logging.level);
        std::vector<spdlog::sink_ptr> sinks;

        // stdout carries the JSON result, logs go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logging.file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, false);
            file_sink->set_level(level);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("dbbridge", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Shuts the pool down (closing SSH tunnels) once SIGINT/SIGTERM arrives.
// A second signal terminates the process with the default action.
std::thread startSignalWatcher(PoolManager& pool) {
    return std::thread([&pool] {
        while (!g_finished) {
            if (g_signal_received) {
                spdlog::info("Received signal {}, shutting down", static_cast<int>(g_signal_received));
                pool.shutdown();
                std::signal(SIGINT, SIG_DFL);
                std::signal(SIGTERM, SIG_DFL);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void printJson(const json& value) {
    std::cout << value.dump(2) << std::endl;
}

json readEditRequest(const std::string& path) {
    if (path == "-") {
        return json::parse(std::cin);
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open edit request file: " + path);
    }
    return json::parse(file);
}

int runCommand(const Config& config, PoolManager& pool) {
    const CommandOptions& cmd = config.command;
    const std::string& id = config.connection_id;
    const ConnectionConfig& conn = config.connections.at(id);

    if (cmd.name == "test") {
        TestConnectionResult result = pool.connect(id, conn);
        printJson(result);
        return result.success ? 0 : 1;
    }

    if (cmd.name == "tables") {
        printJson(pool.listTables(id));
        return 0;
    }

    if (cmd.name == "data") {
        TableDataRequest request;
        request.schema = cmd.schema;
        request.table = cmd.table;
        request.page = cmd.page;
        request.limit = cmd.limit;
        request.filter = cmd.filter;
        request.sortColumn = cmd.sort_column;
        request.sortDirection = cmd.sort_direction;
        printJson(pool.getTableData(id, request));
        return 0;
    }

    if (cmd.name == "structure") {
        printJson(pool.getTableStructure(id, cmd.schema, cmd.table));
        return 0;
    }

    if (cmd.name == "query") {
        QueryResult result = pool.executeQuery(id, cmd.sql);
        printJson(result);
        return result.error ? 1 : 0;
    }

    if (cmd.name == "overview") {
        printJson(pool.getSchemaOverview(id));
        return 0;
    }

    if (cmd.name == "keys") {
        auto progress = [](uint32_t iteration, uint32_t maxIterations, size_t found,
                           const std::vector<std::string>& batch) {
            spdlog::debug("SCAN {}/{}: {} keys in batch, {} found", iteration, maxIterations,
                          batch.size(), found);
        };
        printJson(pool.searchKeys(id, cmd.pattern, cmd.limit, cmd.cursor, progress));
        return 0;
    }

    if (cmd.name == "key") {
        printJson(pool.getKeyDetails(id, cmd.key));
        return 0;
    }

    if (cmd.name == "mutate") {
        RowEdit edit = MutationBuilder::parseEdit(readEditRequest(cmd.mutation_file));
        std::string sql = MutationBuilder::build(conn.db_type, edit);

        json output = {{"sql", sql}};
        int status = 0;
        if (cmd.execute) {
            QueryResult result = pool.executeQuery(id, sql);
            status = result.error ? 1 : 0;
            output["result"] = result;
        }
        printJson(output);
        return status;
    }

    spdlog::error("Unknown command '{}'", cmd.name);
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.logging);

    if (!config.validate()) {
        return 1;
    }

    spdlog::debug("Running '{}' on connection '{}'", config.command.name, config.connection_id);

    setupSignalHandlers();

    auto store = StaticConnectionStore::fromConfig(config);
    auto factory = std::make_shared<DefaultDriverFactory>(config.driver);
    PoolManager pool(factory, store);
    std::thread watcher = startSignalWatcher(pool);

    int result = 1;
    try {
        result = runCommand(config, pool);
    } catch (const DatabaseError& e) {
        spdlog::error("{} in '{}': {}", ErrorHandler::toString(e.kind()), config.command.name, e.what());
    } catch (const json::exception& e) {
        spdlog::error("Invalid JSON: {}", e.what());
    }

    g_finished = true;
    watcher.join();
    pool.shutdown();

    return result;
}
