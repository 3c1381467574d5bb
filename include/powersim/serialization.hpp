// filename: serialization.hpp
// part of Power System Session Server
// MIT License

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "powersim/engine.hpp"

namespace powersim {

// Device types whose injections are reported as generator output, in report order.
const std::vector<std::string>& generatorDeviceTypes();

/**
 * @brief Identity, component counts, DAE shape and base configuration of a model.
 */
nlohmann::json serializeSystemInfo(const ModelInstance& model);

/**
 * @brief Convergence data plus bus and aggregated generator arrays.
 *
 * Arrays are omitted when the last power flow did not converge.
 */
nlohmann::json serializePowerFlowResults(const ModelInstance& model);

/**
 * @brief Time axis and selected variable trajectories.
 * @param variables Names to return; std::nullopt selects every state variable.
 *        Names are looked up among state variables first, then algebraic ones;
 *        unknown names are skipped.
 * @param maxPoints Bound on returned samples; 0 returns the full series.
 */
nlohmann::json serializeTimeDomainResults(const ModelInstance& model,
                                          const std::optional<std::vector<std::string>>& variables,
                                          std::size_t maxPoints);

nlohmann::json serializeTimeDomainVariables(const ModelInstance& model);

nlohmann::json serializeEigenResults(const ModelInstance& model);

}  // namespace powersim
