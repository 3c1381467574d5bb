#include "powersim/config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace powersim {
namespace {

std::size_t requireCount(const std::string& field, const nlohmann::json& node, bool allowZero) {
    if (!node.is_number_integer()) {
        throw std::runtime_error(field + " must be an integer");
    }
    const long long value = node.get<long long>();
    if (value < 0 || (!allowZero && value == 0)) {
        throw std::runtime_error(field + (allowZero ? " must be non-negative" : " must be positive"));
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

ServerConfig loadServerConfigFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open config JSON: " + path);
    }

    nlohmann::json json;
    input >> json;
    if (!json.is_object()) {
        throw std::runtime_error("Config JSON must be an object");
    }

    ServerConfig config{};
    if (json.contains("cases_dir")) {
        std::filesystem::path dir(json.at("cases_dir").get<std::string>());
        if (dir.is_relative()) {
            dir = std::filesystem::path(path).parent_path() / dir;
        }
        config.casesDir = dir.lexically_normal().string();
    }
    if (json.contains("max_sessions")) {
        config.maxSessions = requireCount("max_sessions", json.at("max_sessions"), false);
    }
    if (json.contains("session_ttl")) {
        config.sessionTtl = std::chrono::seconds(
            static_cast<std::chrono::seconds::rep>(requireCount("session_ttl", json.at("session_ttl"), false)));
    }
    if (json.contains("max_result_points")) {
        config.maxResultPoints = requireCount("max_result_points", json.at("max_result_points"), true);
    }
    if (json.contains("workers")) {
        config.workerThreads = requireCount("workers", json.at("workers"), false);
    }
    config.defaultTdsEndTime = json.value("tds_end_time", config.defaultTdsEndTime);
    config.defaultTdsStep = json.value("tds_step", config.defaultTdsStep);
    config.quiet = json.value("quiet", config.quiet);

    validateServerConfig(config);
    return config;
}

void validateServerConfig(const ServerConfig& config) {
    if (config.maxSessions == 0) {
        throw std::runtime_error("max_sessions must be positive");
    }
    if (config.sessionTtl.count() <= 0) {
        throw std::runtime_error("session_ttl must be positive");
    }
    if (config.sessionTtl > std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max())) {
        throw std::runtime_error("session_ttl is too large");
    }
    if (!(config.defaultTdsEndTime > 0.0)) {
        throw std::runtime_error("tds_end_time must be positive");
    }
    if (!(config.defaultTdsStep > 0.0)) {
        throw std::runtime_error("tds_step must be positive");
    }
    if (config.workerThreads == 0) {
        throw std::runtime_error("workers must be positive");
    }
}

}  // namespace powersim
