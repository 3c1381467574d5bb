// filename: config.hpp
// part of Power System Session Server
// MIT License

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "powersim/types.hpp"

namespace powersim {

struct ServerConfig {
    std::string casesDir{"inputs/cases"};
    std::size_t maxSessions{kDefaultMaxSessions};
    std::chrono::seconds sessionTtl{kDefaultSessionTtl};
    std::size_t maxResultPoints{kDefaultMaxResultPoints};
    double defaultTdsEndTime{kDefaultTdsEndTime};
    double defaultTdsStep{kDefaultTdsStep};
    std::size_t workerThreads{1};
    bool quiet{false};
};

/**
 * @brief Read a server configuration file; absent keys keep their defaults.
 *
 * Relative casesDir values are resolved against the file's directory.
 */
ServerConfig loadServerConfigFromJson(const std::string& path);

// Throws std::runtime_error naming the first invalid field.
void validateServerConfig(const ServerConfig& config);

}  // namespace powersim
