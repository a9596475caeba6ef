#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../src/commands/CommandHandler.hpp"
#include "../src/db/RedisStore.hpp"
#include "../src/protocol/RESPEncoder.hpp"
#include "../src/protocol/RESPParser.hpp"

struct BenchmarkResult {
    std::string name;
    size_t operations;
    double duration_ms;
};

// Deferred replies are counted and thrown away.
struct CountingSink : public ReplySink {
    size_t delivered = 0;

    void deliver(int, const std::string&) override { ++delivered; }
};

template <typename Fn>
BenchmarkResult measure(const std::string& name, size_t operations, Fn&& body) {
    auto start = std::chrono::steady_clock::now();
    body();
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {name, operations, duration_ms};
}

BenchmarkResult benchSetGet(size_t iterations) {
    RedisStore store;
    CountingSink sink;
    CommandHandler handler(store, sink);

    return measure("SET+GET round-trip", iterations * 2, [&] {
        for (size_t i = 0; i < iterations; ++i) {
            std::string key = "key:" + std::to_string(i);
            std::string value = "value:" + std::to_string(i);

            handler.execute(std::vector<std::string>{"SET", key, value}, 1);
            handler.execute(std::vector<std::string>{"GET", key}, 1);
        }
    });
}

BenchmarkResult benchSetPx(size_t iterations) {
    RedisStore store;
    CountingSink sink;
    CommandHandler handler(store, sink);

    return measure("SET PX (timer churn)", iterations, [&] {
        for (size_t i = 0; i < iterations; ++i) {
            std::string key = "session:" + std::to_string(i % 64);
            handler.execute(std::vector<std::string>{"SET", key, "v", "PX", "60000"}, 1);
        }
    });
}

BenchmarkResult benchListPushPop(size_t iterations) {
    RedisStore store;
    CountingSink sink;
    CommandHandler handler(store, sink);

    return measure("List RPUSH+LPOP", iterations * 2, [&] {
        for (size_t i = 0; i < iterations; ++i) {
            std::string payload = "job:" + std::to_string(i);

            handler.execute(std::vector<std::string>{"RPUSH", "jobs", payload}, 1);
            handler.execute(std::vector<std::string>{"LPOP", "jobs"}, 1);
        }
    });
}

BenchmarkResult benchBlockingHandoff(size_t iterations) {
    RedisStore store;
    CountingSink sink;
    CommandHandler handler(store, sink);

    BenchmarkResult res = measure("BLPOP park + RPUSH wake", iterations * 2, [&] {
        for (size_t i = 0; i < iterations; ++i) {
            int fd = 100 + static_cast<int>(i % 32);
            handler.execute(std::vector<std::string>{"BLPOP", "work", "10"}, fd);
            handler.execute(std::vector<std::string>{"RPUSH", "work", "item"}, 1);
        }
    });

    if (sink.delivered != iterations)
        std::cerr << "warning: " << sink.delivered << " of " << iterations
                  << " waiters were woken" << std::endl;
    return res;
}

BenchmarkResult benchStreamXadd(size_t iterations) {
    RedisStore store;
    CountingSink sink;
    CommandHandler handler(store, sink);

    return measure("Stream XADD", iterations, [&] {
        for (size_t i = 0; i < iterations; ++i) {
            std::string value = "reading:" + std::to_string(i);
            handler.execute(std::vector<std::string>{"XADD", "telemetry", "*", "sensor", value}, 1);
        }
    });
}

BenchmarkResult benchParsePipeline(size_t iterations) {
    std::string buffer;
    for (size_t i = 0; i < iterations; ++i) {
        buffer += RESPEncoder::encodeCommand({"SET", "key:" + std::to_string(i), "value"});
    }

    return measure("RESP parse (pipelined)", iterations, [&] {
        std::string_view rest(buffer);
        std::vector<std::string> args;
        std::string err;
        std::size_t consumed = 0;

        while (RESPParser::parseCommand(rest, args, consumed, err) == RESPParser::ParseStatus::COMPLETE) {
            rest.remove_prefix(consumed);
        }
        if (!rest.empty())
            std::cerr << "warning: " << rest.size() << " bytes left unparsed" << std::endl;
    });
}

int main() {
    const size_t iterations = 5000;
    std::vector<BenchmarkResult> results;
    results.push_back(benchSetGet(iterations));
    results.push_back(benchSetPx(iterations));
    results.push_back(benchListPushPop(iterations));
    results.push_back(benchBlockingHandoff(iterations));
    results.push_back(benchStreamXadd(iterations));
    results.push_back(benchParsePipeline(iterations));

    std::cout << "redlite micro-benchmarks (" << iterations << " iterations)" << std::endl;
    std::cout << "------------------------------------------------------------" << std::endl;
    std::cout << std::left << std::setw(30) << "Benchmark"
              << std::right << std::setw(18) << "Throughput"
              << std::setw(20) << "Duration (ms)" << std::endl;

    for (const auto& res : results) {
        double ops_per_sec = res.operations / (res.duration_ms / 1000.0);
        std::cout << std::left << std::setw(30) << res.name
                  << std::right << std::setw(12) << std::fixed << std::setprecision(2)
                  << ops_per_sec << " ops/s"
                  << std::setw(18) << std::setprecision(3) << res.duration_ms
                  << std::endl;
    }

    return 0;
}
