// filename: session_benchmark.cpp
// part of Power System Session Server
// MIT License

#include "powersim/recorded_case.hpp"
#include "powersim/session.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::size_t capacity{100};
    std::size_t sessions{1000};
    std::size_t lookups{100000};
    std::size_t threads{4};
    std::size_t repeats{3};
    bool writeCsv{false};
    std::string csvPath{};
};

struct RunTimings {
    double createMs{0.0};
    double lookupMs{0.0};
    std::size_t evictions{0};
    std::size_t misses{0};
};

void printUsage() {
    std::cout << "session_benchmark options:\n"
              << "  --capacity <int>       Session manager capacity (default 100)\n"
              << "  --sessions <int>       Sessions created per repeat (default 1000)\n"
              << "  --lookups <int>        Lookups per repeat, split across threads (default 100000)\n"
              << "  --threads <int>        Lookup threads (default 4)\n"
              << "  --repeats <int>        Number of benchmark repeats (default 3)\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--capacity" && i + 1 < argc) {
                cfg.capacity = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--sessions" && i + 1 < argc) {
                cfg.sessions = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--lookups" && i + 1 < argc) {
                cfg.lookups = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                cfg.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

// Smallest case the recorded engine accepts: one bus, no analysis recordings.
std::unique_ptr<powersim::ModelInstance> makeModel(std::size_t n) {
    powersim::RecordedCase rc{};
    rc.version = "0.1";
    rc.name = "bench-" + std::to_string(n);
    powersim::RecordedCase::Bus bus{powersim::ElementId{static_cast<std::int64_t>(1)}};
    bus.name = "BUS1";
    rc.buses.push_back(bus);
    return std::make_unique<powersim::RecordedModel>(std::move(rc), "bench.json", powersim::LoadOptions{});
}

RunTimings runOnce(const BenchmarkConfig& cfg) {
    powersim::SessionManager manager(cfg.capacity, std::chrono::hours(1));
    RunTimings timings{};

    std::vector<std::string> ids;
    ids.reserve(cfg.sessions);
    const auto createStart = std::chrono::steady_clock::now();
    for (std::size_t n = 0; n < cfg.sessions; ++n) {
        ids.push_back(manager.create(makeModel(n), "bench.json"));
    }
    const auto createEnd = std::chrono::steady_clock::now();
    timings.createMs = std::chrono::duration<double, std::milli>(createEnd - createStart).count();
    timings.evictions = cfg.sessions > cfg.capacity ? cfg.sessions - cfg.capacity : 0;

    std::atomic<std::size_t> misses{0};
    const std::size_t perThread = cfg.lookups / cfg.threads;
    std::vector<std::thread> workers;
    workers.reserve(cfg.threads);
    const auto lookupStart = std::chrono::steady_clock::now();
    for (std::size_t t = 0; t < cfg.threads; ++t) {
        workers.emplace_back([&, t]() {
            for (std::size_t k = 0; k < perThread; ++k) {
                const std::string& id = ids[(t * perThread + k) % ids.size()];
                const auto session = manager.get(id);
                if (!session) {
                    misses.fetch_add(1);
                    continue;
                }
                const auto lease = session->acquire();
                if (!lease) {
                    misses.fetch_add(1);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    const auto lookupEnd = std::chrono::steady_clock::now();
    timings.lookupMs = std::chrono::duration<double, std::milli>(lookupEnd - lookupStart).count();
    timings.misses = misses.load();
    return timings;
}

void writeCsvResult(const BenchmarkConfig& cfg, double avgCreateMs, double avgLookupMs, std::size_t misses) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "capacity,sessions,lookups,threads,avg_create_ms,avg_lookup_ms,misses\n";
    }
    csv << cfg.capacity << ',' << cfg.sessions << ',' << cfg.lookups << ',' << cfg.threads << ','
        << avgCreateMs << ',' << avgLookupMs << ',' << misses << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }

    if (cfg.capacity == 0 || cfg.sessions == 0 || cfg.threads == 0 || cfg.repeats == 0) {
        std::cerr << "capacity, sessions, threads and repeats must be positive.\n";
        return 1;
    }

    std::vector<double> createMs;
    std::vector<double> lookupMs;
    createMs.reserve(cfg.repeats);
    lookupMs.reserve(cfg.repeats);
    RunTimings last{};
    for (std::size_t repeat = 0; repeat < cfg.repeats; ++repeat) {
        try {
            last = runOnce(cfg);
        } catch (const std::exception& ex) {
            std::cerr << "Benchmark run failed: " << ex.what() << "\n";
            return 1;
        }
        createMs.push_back(last.createMs);
        lookupMs.push_back(last.lookupMs);
    }

    const double avgCreateMs =
        std::accumulate(createMs.begin(), createMs.end(), 0.0) / static_cast<double>(createMs.size());
    const double avgLookupMs =
        std::accumulate(lookupMs.begin(), lookupMs.end(), 0.0) / static_cast<double>(lookupMs.size());
    const auto [minIt, maxIt] = std::minmax_element(lookupMs.begin(), lookupMs.end());
    const std::size_t performedLookups = (cfg.lookups / cfg.threads) * cfg.threads;

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Capacity: " << cfg.capacity << ", sessions created: " << cfg.sessions << " ("
              << last.evictions << " evictions per repeat)\n";
    std::cout << "Average create time: " << avgCreateMs << " ms ("
              << (avgCreateMs * 1000.0) / static_cast<double>(cfg.sessions) << " us per session)\n";
    std::cout << "Average lookup time: " << avgLookupMs << " ms for " << performedLookups << " lookups on "
              << cfg.threads << " threads (min=" << *minIt << " ms, max=" << *maxIt << " ms)\n";
    if (performedLookups > 0 && avgLookupMs > 0.0) {
        std::cout << "Throughput: " << static_cast<double>(performedLookups) / (avgLookupMs / 1000.0) / 1.0e6
                  << "e6 lookups/s\n";
    }
    std::cout << "Misses (evicted ids): " << last.misses << '\n';

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, avgCreateMs, avgLookupMs, last.misses);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }
    return 0;
}
