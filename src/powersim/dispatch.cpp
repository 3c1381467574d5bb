#include "powersim/dispatch.hpp"

#include "powersim/log.hpp"
#include "powersim/serialization.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <utility>

namespace powersim {
namespace {

std::string notFoundMessage(const std::string& sessionId) { return "Session not found: " + sessionId; }

double toEpochSeconds(WallClock::time_point t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

std::string requireString(const nlohmann::json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Missing or non-string parameter: ") + key);
    }
    return it->get<std::string>();
}

bool optionalBool(const nlohmann::json& params, const char* key, bool fallback) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(std::string("Parameter must be a boolean: ") + key);
    }
    return it->get<bool>();
}

std::optional<double> optionalNumber(const nlohmann::json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("Parameter must be a number: ") + key);
    }
    return it->get<double>();
}

std::optional<long long> optionalInteger(const nlohmann::json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("Parameter must be an integer: ") + key);
    }
    return it->get<long long>();
}

std::optional<std::string> optionalString(const nlohmann::json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Parameter must be a string: ") + key);
    }
    return it->get<std::string>();
}

std::optional<std::vector<std::string>> optionalStringList(const nlohmann::json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("Parameter must be a list of strings: ") + key);
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string("Parameter must be a list of strings: ") + key);
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

}  // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::PreconditionFailed:
            return "precondition_failed";
        case ErrorKind::EngineFailure:
            return "engine_failure";
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::None:
        default:
            return "none";
    }
}

ToolResult ToolResult::ok(nlohmann::json payload) {
    ToolResult result;
    result.success = true;
    result.payload = std::move(payload);
    return result;
}

ToolResult ToolResult::failure(ErrorKind kind, std::string message) {
    ToolResult result;
    result.success = false;
    result.kind = kind;
    result.error = std::move(message);
    return result;
}

nlohmann::json ToolResult::toJson() const {
    if (!success) {
        return {{"success", false}, {"error", error}, {"error_kind", errorKindName(kind)}};
    }
    nlohmann::json out = payload.is_object() ? payload : nlohmann::json::object();
    out["success"] = true;
    return out;
}

ToolDispatcher::ToolDispatcher(SessionManager& sessions, Engine& engine, const CaseCatalog& catalog,
                               ServerConfig config)
    : sessions_(sessions), engine_(engine), catalog_(catalog), config_(std::move(config)) {}

const std::vector<std::string>& ToolDispatcher::toolNames() {
    static const std::vector<std::string> names{
        "list_available_cases", "load_case",         "get_system_info",  "list_sessions",
        "close_session",        "run_power_flow",    "run_time_domain",  "run_eigenvalue",
        "get_pflow_results",    "get_tds_results",   "list_tds_variables", "server_info"};
    return names;
}

template <typename Fn>
ToolResult ToolDispatcher::withSession(const std::string& sessionId, const char* action, Fn&& fn) {
    const std::shared_ptr<Session> session = sessions_.get(sessionId);
    if (!session) {
        return ToolResult::failure(ErrorKind::NotFound, notFoundMessage(sessionId));
    }
    const SessionLease lease = session->acquire();
    if (!lease) {
        // Closed or evicted while this call waited for the lease.
        return ToolResult::failure(ErrorKind::NotFound, notFoundMessage(sessionId));
    }
    try {
        return fn(lease.model());
    } catch (const std::exception& ex) {
        logWarning(std::string("Error ") + action + " for session " + sessionId + ": " + ex.what());
        return ToolResult::failure(ErrorKind::EngineFailure, std::string("Error ") + action + ": " + ex.what());
    }
}

nlohmann::json ToolDispatcher::call(const std::string& tool, const nlohmann::json& params) {
    const nlohmann::json& args = params.is_null() ? nlohmann::json::object() : params;
    if (!args.is_object()) {
        return ToolResult::failure(ErrorKind::InvalidArgument, "Parameters must be a JSON object").toJson();
    }

    try {
        if (tool == "list_available_cases") {
            return listAvailableCases().toJson();
        }
        if (tool == "load_case") {
            return loadCase(requireString(args, "case_path"), optionalBool(args, "setup", true),
                            optionalBool(args, "no_output", true))
                .toJson();
        }
        if (tool == "get_system_info") {
            return getSystemInfo(requireString(args, "session_id")).toJson();
        }
        if (tool == "list_sessions") {
            return listSessions().toJson();
        }
        if (tool == "close_session") {
            return closeSession(requireString(args, "session_id")).toJson();
        }
        if (tool == "run_power_flow") {
            PowerFlowOptions options{};
            options.tol = optionalNumber(args, "tol");
            if (const auto maxIter = optionalInteger(args, "max_iter")) {
                if (*maxIter < 1 || *maxIter > std::numeric_limits<int>::max()) {
                    throw std::invalid_argument("Parameter max_iter must be between 1 and " +
                                                std::to_string(std::numeric_limits<int>::max()));
                }
                options.maxIter = static_cast<int>(*maxIter);
            }
            options.method = optionalString(args, "method");
            return runPowerFlow(requireString(args, "session_id"), options).toJson();
        }
        if (tool == "run_time_domain") {
            TimeDomainRequest request{};
            request.tf = optionalNumber(args, "tf");
            request.tstep = optionalNumber(args, "tstep");
            request.tol = optionalNumber(args, "tol");
            request.method = optionalString(args, "method");
            return runTimeDomain(requireString(args, "session_id"), request).toJson();
        }
        if (tool == "run_eigenvalue") {
            return runEigenvalue(requireString(args, "session_id")).toJson();
        }
        if (tool == "get_pflow_results") {
            return getPowerFlowResults(requireString(args, "session_id")).toJson();
        }
        if (tool == "get_tds_results") {
            std::optional<std::size_t> maxPoints;
            if (const auto value = optionalInteger(args, "max_points")) {
                if (*value < 0) {
                    throw std::invalid_argument("Parameter must be non-negative: max_points");
                }
                maxPoints = static_cast<std::size_t>(*value);
            }
            return getTimeDomainResults(requireString(args, "session_id"), optionalStringList(args, "variables"),
                                        maxPoints)
                .toJson();
        }
        if (tool == "list_tds_variables") {
            return listTimeDomainVariables(requireString(args, "session_id")).toJson();
        }
        if (tool == "server_info") {
            return serverInfo().toJson();
        }
    } catch (const std::invalid_argument& ex) {
        return ToolResult::failure(ErrorKind::InvalidArgument, ex.what()).toJson();
    }
    return ToolResult::failure(ErrorKind::InvalidArgument, "Unknown tool: " + tool).toJson();
}

nlohmann::json ToolDispatcher::handleRequestLine(const std::string& line) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        return {{"id", nullptr},
                {"result", ToolResult::failure(ErrorKind::InvalidArgument,
                                               std::string("Malformed request: ") + ex.what())
                               .toJson()}};
    }
    if (!request.is_object()) {
        return {{"id", nullptr},
                {"result", ToolResult::failure(ErrorKind::InvalidArgument, "Request must be a JSON object").toJson()}};
    }

    nlohmann::json id = request.contains("id") ? request.at("id") : nlohmann::json(nullptr);
    const auto tool = request.find("tool");
    if (tool == request.end() || !tool->is_string()) {
        return {{"id", std::move(id)},
                {"result", ToolResult::failure(ErrorKind::InvalidArgument, "Request is missing a tool name").toJson()}};
    }
    const nlohmann::json params = request.contains("params") ? request.at("params") : nlohmann::json::object();
    return {{"id", std::move(id)}, {"result", call(tool->get<std::string>(), params)}};
}

ToolResult ToolDispatcher::listAvailableCases() const {
    const std::vector<std::string> cases = catalog_.listCases();
    return ToolResult::ok({{"cases", cases}, {"count", cases.size()}, {"cases_dir", catalog_.casesDir().string()}});
}

ToolResult ToolDispatcher::loadCase(const std::string& casePath, bool setup, bool noOutput) {
    const auto resolved = catalog_.resolve(casePath);
    if (!resolved) {
        return ToolResult::failure(ErrorKind::InvalidArgument,
                                   "Case file not found: " + casePath + ". Path resolved to: " +
                                       (catalog_.casesDir() / casePath).string());
    }

    LoadOptions options{};
    options.setup = setup;
    options.noOutput = noOutput;

    std::unique_ptr<ModelInstance> model;
    nlohmann::json systemInfo;
    try {
        model = engine_.load(resolved->string(), options);
        if (!model) {
            return ToolResult::failure(ErrorKind::EngineFailure,
                                       "Failed to load case: " + casePath +
                                           ". The file may be corrupted or in an unsupported format.");
        }
        systemInfo = serializeSystemInfo(*model);
    } catch (const std::exception& ex) {
        logWarning("Error loading case " + casePath + ": " + ex.what());
        return ToolResult::failure(ErrorKind::EngineFailure, std::string("Error loading case: ") + ex.what());
    }

    const std::string sessionId = sessions_.create(std::move(model), casePath);
    logInfo("Loaded case " + casePath + " into session " + sessionId);
    return ToolResult::ok({{"session_id", sessionId}, {"case_path", casePath}, {"system_info", systemInfo}});
}

ToolResult ToolDispatcher::getSystemInfo(const std::string& sessionId) {
    return withSession(sessionId, "getting system info", [&](ModelInstance& model) {
        nlohmann::json payload = serializeSystemInfo(model);
        payload["session_id"] = sessionId;
        return ToolResult::ok(std::move(payload));
    });
}

ToolResult ToolDispatcher::listSessions() {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& info : sessions_.list()) {
        sessions.push_back({{"session_id", info.sessionId},
                            {"case_path", info.sourcePath},
                            {"created_at", toEpochSeconds(info.createdAt)},
                            {"last_accessed", toEpochSeconds(info.lastAccessedAt)}});
    }
    const std::size_t count = sessions.size();
    return ToolResult::ok({{"sessions", std::move(sessions)}, {"count", count}});
}

ToolResult ToolDispatcher::closeSession(const std::string& sessionId) {
    if (!sessions_.close(sessionId)) {
        return ToolResult::failure(ErrorKind::NotFound, notFoundMessage(sessionId));
    }
    logInfo("Closed session " + sessionId);
    return ToolResult::ok({{"message", "Session " + sessionId + " closed successfully"}});
}

ToolResult ToolDispatcher::runPowerFlow(const std::string& sessionId, const PowerFlowOptions& options) {
    return withSession(sessionId, "running power flow", [&](ModelInstance& model) {
        model.runPowerFlow(options);
        return ToolResult::ok(serializePowerFlowResults(model));
    });
}

ToolResult ToolDispatcher::runTimeDomain(const std::string& sessionId, const TimeDomainRequest& request) {
    return withSession(sessionId, "running time-domain simulation", [&](ModelInstance& model) {
        if (!model.powerFlowStatus().converged) {
            return ToolResult::failure(ErrorKind::PreconditionFailed,
                                       "Power flow must be run successfully before time-domain simulation");
        }

        TimeDomainOptions options{};
        options.tf = request.tf.value_or(config_.defaultTdsEndTime);
        options.tstep = request.tstep ? request.tstep : std::optional<double>(config_.defaultTdsStep);
        options.tol = request.tol;
        options.method = request.method;

        const bool success = model.runTimeDomain(options);
        const TimeDomainStatus status = model.timeDomainStatus();
        nlohmann::json payload;
        payload["converged"] = success && !status.busted;
        payload["exec_time"] = status.execTime;
        payload["time_range"] = {status.t0, status.tf};
        payload["n_points"] = model.timeSeries().t.size();
        payload["message"] = "Time-domain simulation completed. Use get_tds_results to retrieve data.";
        return ToolResult::ok(std::move(payload));
    });
}

ToolResult ToolDispatcher::runEigenvalue(const std::string& sessionId) {
    return withSession(sessionId, "running eigenvalue analysis", [&](ModelInstance& model) {
        if (!model.powerFlowStatus().converged) {
            return ToolResult::failure(ErrorKind::PreconditionFailed,
                                       "Power flow must be run successfully before eigenvalue analysis");
        }
        model.runEigen();
        const auto eig = model.eigenResult();
        if (!eig || eig->eigenvalues.empty()) {
            return ToolResult::failure(ErrorKind::PreconditionFailed, "Eigenvalue analysis has not been run yet");
        }
        return ToolResult::ok(serializeEigenResults(model));
    });
}

ToolResult ToolDispatcher::getPowerFlowResults(const std::string& sessionId) {
    return withSession(sessionId, "retrieving power flow results",
                       [&](ModelInstance& model) { return ToolResult::ok(serializePowerFlowResults(model)); });
}

ToolResult ToolDispatcher::getTimeDomainResults(const std::string& sessionId,
                                                const std::optional<std::vector<std::string>>& variables,
                                                std::optional<std::size_t> maxPoints) {
    return withSession(sessionId, "retrieving TDS results", [&](ModelInstance& model) {
        if (!model.timeDomainStatus().initialized) {
            return ToolResult::failure(ErrorKind::PreconditionFailed, "Time-domain simulation not initialized");
        }
        return ToolResult::ok(
            serializeTimeDomainResults(model, variables, maxPoints.value_or(config_.maxResultPoints)));
    });
}

ToolResult ToolDispatcher::listTimeDomainVariables(const std::string& sessionId) {
    return withSession(sessionId, "listing variables", [&](ModelInstance& model) {
        if (!model.timeDomainStatus().initialized) {
            return ToolResult::failure(ErrorKind::PreconditionFailed, "Time-domain simulation not initialized");
        }
        return ToolResult::ok(serializeTimeDomainVariables(model));
    });
}

ToolResult ToolDispatcher::serverInfo() const {
    return ToolResult::ok({{"name", kServerName},
                           {"version", kServerVersion},
                           {"tools", toolNames()},
                           {"max_sessions", sessions_.capacity()},
                           {"session_timeout", config_.sessionTtl.count()},
                           {"max_result_points", config_.maxResultPoints},
                           {"cases_dir", catalog_.casesDir().string()},
                           {"active_sessions", sessions_.size()}});
}

}  // namespace powersim
