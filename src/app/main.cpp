/**
 * @file main.cpp
 * @brief ClusterExec command-line entry point.
 *
 * Wires the modules into a small request stage:
 *   Config → Logger → ThreadPoolExecutor → traced tasks → results
 */

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "executor/thread_pool.hpp"
#include "logging/log_sinks.hpp"
#include "tracing/trace_state.hpp"
#include "transaction/xid.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cluster_exec;

namespace {

struct CLIArgs {
    std::filesystem::path config_path;
    size_t task_count = 16;
    std::string xid;
};

void print_usage() {
    std::cout << "Usage: cluster_exec [OPTIONS]\n"
              << "  --config <path>    Configuration file (TOML)\n"
              << "  --tasks <n>        Number of tasks to run (default: 16)\n"
              << "  --xid <text>       Parse a transaction id, print it and exit\n"
              << "  --help, -h         Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--tasks" && i + 1 < argc) {
            try {
                args.task_count = static_cast<size_t>(std::stoul(argv[++i]));
            } catch (const std::logic_error&) {
                return Error{ErrorCode::InvalidConfig, std::string{"Invalid --tasks value: "} + argv[i]};
            }
        } else if (arg == "--xid" && i + 1 < argc) {
            args.xid = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::InvalidConfig, "Unknown argument: " + arg};
        }
    }
    return args;
}

int run_xid(const std::string& text) {
    auto xid = parse_xid(text);
    if (!xid) {
        std::cerr << xid.error().message << std::endl;
        return 1;
    }
    std::cout << "format_id=" << xid->format_id
              << " branch_qualifier_bytes=" << xid->branch_qualifier.size()
              << " global_transaction_id_bytes=" << xid->global_transaction_id.size()
              << "\n" << to_string(*xid) << std::endl;
    return 0;
}

/**
 * @brief Run a traced batch, one task of which fails, and report the outcome.
 */
int run_batch(const Config& config, size_t task_count, Logger& logger) {
    ThreadPoolExecutor executor(config.executor.name,
                                config.executor.thread_count,
                                config.executor.queue_capacity,
                                logger);

    TraceStatePtr session;
    if (config.tracing.enabled) {
        session = Tracing::begin(config.tracing.node);
        logger.info("Trace session " + session->session_id() + " started");
    }

    std::vector<FutureTaskPtr<uint64_t>> futures;
    futures.reserve(task_count);
    for (size_t i = 0; i < task_count; ++i) {
        futures.push_back(executor.submit([i]() -> uint64_t {
            Tracing::trace("computing task " + std::to_string(i));
            if (i == 3) throw std::runtime_error("task 3 failed on purpose");
            return static_cast<uint64_t>(i) * i;
        }));
    }

    size_t succeeded = 0;
    size_t failed = 0;
    uint64_t sum = 0;
    for (auto& future : futures) {
        try {
            sum += future->get(std::chrono::seconds(30));
            ++succeeded;
        } catch (const ExecutionError& e) {
            logger.info(std::string{"Task failed: "} + e.what());
            ++failed;
        } catch (const TimeoutError& e) {
            logger.error(std::string{"Task timed out: "} + e.what());
            ++failed;
        }
    }

    executor.shutdown();
    auto stats = executor.stats();
    logger.info("Batch done: " + std::to_string(succeeded) + " ok, "
                + std::to_string(failed) + " failed, sum " + std::to_string(sum)
                + ", completed " + std::to_string(stats.completed));

    if (session) {
        logger.info("Trace session recorded " + std::to_string(session->events().size()) + " events");
        Tracing::set(nullptr);
    }
    const size_t expected_failures = task_count > 3 ? 1 : 0;
    return failed == expected_failures ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << std::endl;
        print_usage();
        return 2;
    }

    if (!args->xid.empty()) {
        return run_xid(args->xid);
    }

    Config config = default_config();
    if (!args->config_path.empty()) {
        auto loaded = load_config(args->config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }

    auto logger = make_logger(config.logging, "cluster_exec");
    if (!logger) {
        std::cerr << "Failed to create logger: " << logger.error().message << std::endl;
        return 1;
    }

    int rc = run_batch(config, args->task_count, **logger);
    (*logger)->flush();
    return rc;
}
