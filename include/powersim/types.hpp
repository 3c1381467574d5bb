// filename: types.hpp
// part of Power System Session Server
// MIT License

#pragma once

#include <chrono>
#include <cstddef>

namespace powersim {

constexpr const char* kServerName = "powersim-session-server";
constexpr const char* kServerVersion = "0.1.0";

constexpr std::size_t kDefaultMaxSessions = 100;
constexpr std::chrono::seconds kDefaultSessionTtl{3600};

// Upper bound on samples returned by a single time-domain retrieval.
constexpr std::size_t kDefaultMaxResultPoints = 10000;

constexpr double kDefaultTdsEndTime = 20.0;
constexpr double kDefaultTdsStep = 1.0 / 30.0;

}  // namespace powersim
