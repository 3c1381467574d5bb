#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "powersim/catalog.hpp"
#include "powersim/config.hpp"
#include "powersim/engine.hpp"
#include "powersim/session.hpp"

namespace powersim {

enum class ErrorKind { None, NotFound, PreconditionFailed, EngineFailure, InvalidArgument };

const char* errorKindName(ErrorKind kind);

/**
 * @brief Outcome of one tool call: a payload on success, a kind plus message otherwise.
 */
struct ToolResult {
    bool success{false};
    ErrorKind kind{ErrorKind::None};
    std::string error;
    nlohmann::json payload;

    static ToolResult ok(nlohmann::json payload);
    static ToolResult failure(ErrorKind kind, std::string message);

    // {"success": true, ...payload} or {"success": false, "error": ..., "error_kind": ...}
    [[nodiscard]] nlohmann::json toJson() const;
};

struct TimeDomainRequest {
    std::optional<double> tf;
    std::optional<double> tstep;
    std::optional<double> tol;
    std::optional<std::string> method;
};

/**
 * @brief Maps named operations onto the session manager, the engine and the serializers.
 *
 * Every engine call runs under the session's lease. Engine exceptions are
 * turned into EngineFailure results here and never escape.
 */
class ToolDispatcher {
public:
    ToolDispatcher(SessionManager& sessions, Engine& engine, const CaseCatalog& catalog, ServerConfig config);

    /**
     * @brief Invoke a tool by name with JSON parameters.
     *
     * Unknown tools and malformed parameters yield InvalidArgument results.
     */
    nlohmann::json call(const std::string& tool, const nlohmann::json& params);

    /**
     * @brief Handle one protocol line: {"id", "tool", "params"} in, {"id", "result"} out.
     *
     * Lines that are not valid requests produce an InvalidArgument result with
     * a null id.
     */
    nlohmann::json handleRequestLine(const std::string& line);

    static const std::vector<std::string>& toolNames();

    ToolResult listAvailableCases() const;
    ToolResult loadCase(const std::string& casePath, bool setup = true, bool noOutput = true);
    ToolResult getSystemInfo(const std::string& sessionId);
    ToolResult listSessions();
    ToolResult closeSession(const std::string& sessionId);

    ToolResult runPowerFlow(const std::string& sessionId, const PowerFlowOptions& options);
    ToolResult runTimeDomain(const std::string& sessionId, const TimeDomainRequest& request);
    ToolResult runEigenvalue(const std::string& sessionId);

    ToolResult getPowerFlowResults(const std::string& sessionId);
    ToolResult getTimeDomainResults(const std::string& sessionId,
                                    const std::optional<std::vector<std::string>>& variables,
                                    std::optional<std::size_t> maxPoints);
    ToolResult listTimeDomainVariables(const std::string& sessionId);

    ToolResult serverInfo() const;

private:
    template <typename Fn>
    ToolResult withSession(const std::string& sessionId, const char* action, Fn&& fn);

    SessionManager& sessions_;
    Engine& engine_;
    const CaseCatalog& catalog_;
    ServerConfig config_;
};

}  // namespace powersim
