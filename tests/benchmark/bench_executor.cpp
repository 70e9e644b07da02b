/**
 * @file bench_executor.cpp
 * @brief Latency benchmarks for task submission, retrieval and the Xid codec.
 *
 * Usage: ./bench_executor [--csv]
 */

#include "core/logger.hpp"
#include "executor/manual_executor.hpp"
#include "executor/thread_pool.hpp"
#include "logging/log_sinks.hpp"
#include "tracing/trace_state.hpp"
#include "transaction/xid.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cluster_exec;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_inline(Logger& logger) {
    std::vector<BenchResult> R;
    ManualExecutor executor(logger);

    R.push_back(run_bench("submit+run+get", "Inline", 10000,
        [&]{
            auto f = executor.submit([] { return 1; });
            executor.run_pending();
            (void)f->get();
        }, "ManualExecutor"));

    auto session = std::make_shared<TraceState>("bench", "node-01");
    R.push_back(run_bench("submit+run+get (traced)", "Inline", 10000,
        [&]{
            TraceScope scope(session);
            auto f = executor.submit([] { return 1; });
            executor.run_pending();
            (void)f->get();
        }, "ManualExecutor"));

    return R;
}

std::vector<BenchResult> bench_pool(Logger& logger) {
    std::vector<BenchResult> R;

    for (size_t threads : {1, 4}) {
        ThreadPoolExecutor pool("bench", threads, 0, logger);
        auto label = std::to_string(threads) + " workers";

        R.push_back(run_bench("round_trip(" + std::to_string(threads) + ")", "Thread Pool", 5000,
            [&]{ (void)pool.submit([] { return 1; })->get(); }, label));

        R.push_back(run_bench("batch_100(" + std::to_string(threads) + ")", "Thread Pool", 200,
            [&]{
                std::vector<FutureTaskPtr<int>> fs;
                fs.reserve(100);
                for (int i = 0; i < 100; ++i) fs.push_back(pool.submit([i] { return i; }));
                for (auto& f : fs) (void)f->get();
            }, label));

        R.push_back(run_bench("failing_round_trip(" + std::to_string(threads) + ")", "Thread Pool", 2000,
            [&]{
                auto f = pool.submit([]() -> int { throw std::runtime_error("x"); });
                try { (void)f->get(); } catch (const ExecutionError&) {}
            }, label));
    }

    // Reference point for the same round trip through the standard library.
    R.push_back(run_bench("std::async round_trip", "Thread Pool", 5000,
        [&]{ (void)std::async(std::launch::async, [] { return 1; }).get(); }, "baseline"));

    return R;
}

std::vector<BenchResult> bench_xid() {
    std::vector<BenchResult> R;
    Xid xid{.format_id = 42,
            .branch_qualifier = Bytes(16, 0xAB),
            .global_transaction_id = Bytes(64, 0x5C)};
    auto text = to_string(xid);

    R.push_back(run_bench("encode(16B,64B)", "Xid Codec", 10000,
        [&]{ auto s = to_string(xid); (void)s; }, std::to_string(text.size()) + " chars"));
    R.push_back(run_bench("parse(16B,64B)", "Xid Codec", 10000,
        [&]{ auto r = parse_xid(text); (void)r; }, std::to_string(text.size()) + " chars"));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ClusterExec Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    Logger logger(std::make_unique<NullSink>());

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_inline(logger));
    append(bench_pool(logger));
    append(bench_xid());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
