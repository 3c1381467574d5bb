#include "powersim/catalog.hpp"
#include "powersim/config.hpp"
#include "powersim/dispatch.hpp"
#include "powersim/log.hpp"
#include "powersim/recorded_case.hpp"
#include "powersim/session.hpp"
#include "powersim/types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: powersim_server [--config PATH] [--cases-dir DIR]"
                 " [--max-sessions N] [--session-ttl SEC] [--max-points N]"
                 " [--workers N] [--quiet] [--help]\n"
                 "Reads one JSON request per line on stdin and writes one JSON response per line on stdout.\n";
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

/**
 * @brief FIFO of raw request lines shared between the reader and the workers.
 */
class RequestQueue {
public:
    void push(std::string line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(std::move(line));
        }
        ready_.notify_one();
    }

    // No more input; workers drain what is queued and then stop.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    std::optional<std::string> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !lines_.empty(); });
        if (lines_.empty()) {
            return std::nullopt;
        }
        std::string line = std::move(lines_.front());
        lines_.pop_front();
        return line;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::string> lines_;
    bool closed_{false};
};

class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out) : out_(out) {}

    void write(const nlohmann::json& response) {
        const std::string text = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << text << '\n';
        out_.flush();
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

bool parseCount(const char* flag, const char* text, bool allowZero, std::size_t& out) {
    long long value = 0;
    try {
        value = std::stoll(text);
    } catch (const std::exception&) {
        std::cerr << flag << " requires a valid integer argument\n";
        return false;
    }
    if (value < 0 || (!allowZero && value == 0)) {
        std::cerr << flag << (allowZero ? " must be non-negative\n" : " must be positive\n");
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace powersim;

    std::optional<std::string> configPath;
    std::optional<std::string> casesDirOverride;
    std::optional<std::size_t> maxSessionsOverride;
    std::optional<std::size_t> sessionTtlOverride;
    std::optional<std::size_t> maxPointsOverride;
    std::optional<std::size_t> workersOverride;
    bool quietFlag = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                printUsage();
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--cases-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--cases-dir requires a directory argument\n";
                printUsage();
                return 1;
            }
            casesDirOverride = std::string(argv[++i]);
        } else if (arg == "--max-sessions") {
            if (i + 1 >= argc) {
                std::cerr << "--max-sessions requires an integer argument\n";
                printUsage();
                return 1;
            }
            std::size_t value = 0;
            if (!parseCount("--max-sessions", argv[++i], false, value)) {
                return 1;
            }
            maxSessionsOverride = value;
        } else if (arg == "--session-ttl") {
            if (i + 1 >= argc) {
                std::cerr << "--session-ttl requires a number of seconds\n";
                printUsage();
                return 1;
            }
            std::size_t value = 0;
            if (!parseCount("--session-ttl", argv[++i], false, value)) {
                return 1;
            }
            sessionTtlOverride = value;
        } else if (arg == "--max-points") {
            if (i + 1 >= argc) {
                std::cerr << "--max-points requires an integer argument\n";
                printUsage();
                return 1;
            }
            std::size_t value = 0;
            if (!parseCount("--max-points", argv[++i], true, value)) {
                return 1;
            }
            maxPointsOverride = value;
        } else if (arg == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "--workers requires an integer argument\n";
                printUsage();
                return 1;
            }
            std::size_t value = 0;
            if (!parseCount("--workers", argv[++i], false, value)) {
                return 1;
            }
            workersOverride = value;
        } else if (arg == "--quiet") {
            quietFlag = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    ServerConfig config{};
    if (configPath) {
        try {
            config = loadServerConfigFromJson(*configPath);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to load config: " << ex.what() << "\n";
            return 1;
        }
    }
    if (casesDirOverride) {
        config.casesDir = *casesDirOverride;
    }
    if (maxSessionsOverride) {
        config.maxSessions = *maxSessionsOverride;
    }
    if (sessionTtlOverride) {
        config.sessionTtl = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(*sessionTtlOverride));
    }
    if (maxPointsOverride) {
        config.maxResultPoints = *maxPointsOverride;
    }
    if (workersOverride) {
        config.workerThreads = *workersOverride;
    }
    if (quietFlag) {
        config.quiet = true;
    }

    try {
        validateServerConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 1;
    }
    setLogQuiet(config.quiet);

    RecordedCaseEngine engine;
    const CaseCatalog catalog(config.casesDir, engine.supportedExtensions());
    std::unique_ptr<SessionManager> sessionsOwner;
    try {
        sessionsOwner = std::make_unique<SessionManager>(config.maxSessions, config.sessionTtl);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to start session manager: " << ex.what() << "\n";
        return 1;
    }
    SessionManager& sessions = *sessionsOwner;
    ToolDispatcher dispatcher(sessions, engine, catalog, config);

    logInfo(std::string(kServerName) + " " + kServerVersion + " ready; cases from " + config.casesDir + ", " +
            std::to_string(config.workerThreads) + " worker(s), max " + std::to_string(config.maxSessions) +
            " sessions");

    RequestQueue queue;
    ResponseWriter writer(std::cout);
    std::vector<std::thread> workers;
    workers.reserve(config.workerThreads);
    for (std::size_t t = 0; t < config.workerThreads; ++t) {
        workers.emplace_back([&]() {
            while (const auto line = queue.pop()) {
                try {
                    writer.write(dispatcher.handleRequestLine(*line));
                } catch (const std::exception& ex) {
                    logError(std::string("Failed to handle request: ") + ex.what());
                    writer.write({{"id", nullptr},
                                  {"result", ToolResult::failure(ErrorKind::EngineFailure, ex.what()).toJson()}});
                }
            }
        });
    }

    std::string line;
    std::size_t received = 0;
    while (std::getline(std::cin, line)) {
        if (isBlank(line)) {
            continue;
        }
        ++received;
        queue.push(std::move(line));
        line.clear();
    }
    queue.close();
    for (auto& worker : workers) {
        worker.join();
    }

    logInfo("Input closed after " + std::to_string(received) + " request(s); closing " +
            std::to_string(sessions.size()) + " session(s)");
    sessions.shutdown();
    return 0;
}
