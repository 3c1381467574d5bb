#include "powersim/serialization.hpp"

#include "powersim/downsample.hpp"
#include "powersim/numeric.hpp"

#include <cmath>
#include <unordered_set>

namespace powersim {
namespace {

struct SelectedVariable {
    std::string name;
    bool algebraic{false};
    std::size_t column{0};
};

std::optional<std::size_t> findName(const std::vector<std::string>& names, const std::string& wanted) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<SelectedVariable> selectVariables(const ModelInstance& model,
                                              const std::optional<std::vector<std::string>>& requested) {
    const auto& stateNames = model.stateNames();
    const auto& algebraicNames = model.algebraicNames();

    std::vector<SelectedVariable> selected;
    if (!requested) {
        selected.reserve(stateNames.size());
        for (std::size_t i = 0; i < stateNames.size(); ++i) {
            selected.push_back({stateNames[i], false, i});
        }
        return selected;
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : *requested) {
        if (!seen.insert(name).second) {
            continue;
        }
        const auto stateCol = findName(stateNames, name);
        if (stateCol) {
            selected.push_back({name, false, *stateCol});
            continue;
        }
        const auto algebraicCol = findName(algebraicNames, name);
        if (algebraicCol) {
            selected.push_back({name, true, *algebraicCol});
        }
    }
    return selected;
}

}  // namespace

const std::vector<std::string>& generatorDeviceTypes() {
    static const std::vector<std::string> types{"Slack", "PV", "PQ"};
    return types;
}

nlohmann::json serializeSystemInfo(const ModelInstance& model) {
    nlohmann::json info;
    const std::string name = model.name();
    info["name"] = name.empty() ? std::string{"Untitled"} : name;
    const std::string casePath = model.casePath();
    if (casePath.empty()) {
        info["case_path"] = nullptr;
    } else {
        info["case_path"] = casePath;
    }
    info["is_setup"] = model.isSetup();

    nlohmann::json models = nlohmann::json::object();
    for (const auto& component : model.components()) {
        if (component.count == 0) {
            continue;
        }
        models[component.type] = {{"count", component.count}, {"group", component.group}};
    }
    info["models"] = std::move(models);

    const DaeShape dae = model.daeShape();
    info["dae_info"] = {{"n_states", dae.nStates},
                        {"n_algebraic", dae.nAlgebraic},
                        {"time", toJsonScalar(dae.time)}};

    const SystemConfig config = model.config();
    info["config"] = {{"freq", toJsonScalar(config.frequency)}, {"mva", toJsonScalar(config.powerBase)}};
    return info;
}

nlohmann::json serializePowerFlowResults(const ModelInstance& model) {
    const PowerFlowStatus status = model.powerFlowStatus();
    if (!status.converged) {
        return {{"converged", false},
                {"iterations", status.iterations},
                {"error", "Power flow did not converge"}};
    }

    nlohmann::json results;
    results["converged"] = true;
    results["iterations"] = status.iterations;
    results["exec_time"] = toJsonScalar(status.execTime);

    const BusTable buses = model.buses();
    if (!buses.idx.empty()) {
        results["buses"] = {{"idx", toJsonArray(buses.idx)},
                            {"name", toJsonArray(buses.name)},
                            {"voltage", toJsonArray(buses.voltage)},
                            {"angle", toJsonArray(buses.angle)}};
    } else {
        results["buses"] = nlohmann::json::object();
    }

    InjectionTable generators;
    for (const auto& type : generatorDeviceTypes()) {
        const InjectionTable table = model.injections(type);
        generators.idx.insert(generators.idx.end(), table.idx.begin(), table.idx.end());
        generators.p.insert(generators.p.end(), table.p.begin(), table.p.end());
        generators.q.insert(generators.q.end(), table.q.begin(), table.q.end());
    }
    if (!generators.idx.empty()) {
        results["generators"] = {{"idx", toJsonArray(generators.idx)},
                                 {"p", toJsonArray(generators.p)},
                                 {"q", toJsonArray(generators.q)}};
    }
    results["summary"] = nlohmann::json::object();
    return results;
}

nlohmann::json serializeTimeDomainResults(const ModelInstance& model,
                                          const std::optional<std::vector<std::string>>& variables,
                                          std::size_t maxPoints) {
    const TimeDomainStatus status = model.timeDomainStatus();
    if (!status.initialized) {
        return {{"initialized", false}, {"error", "Time-domain simulation not initialized"}};
    }

    const TimeSeries& series = model.timeSeries();
    const DownsamplePlan plan = planDownsample(series.t.size(), maxPoints);

    nlohmann::json results;
    results["initialized"] = true;
    results["converged"] = !status.busted;
    results["exec_time"] = toJsonScalar(status.execTime);
    results["time"] = toJsonArray(applyDownsample(series.t, plan));
    results["n_points"] = series.t.size();
    results["downsampled"] = plan.downsampled;
    if (plan.downsampled) {
        results["downsample_factor"] = plan.stride;
    }

    nlohmann::json values = nlohmann::json::object();
    for (const auto& variable : selectVariables(model, variables)) {
        const DenseMatrix& source = variable.algebraic ? series.y : series.x;
        if (variable.column >= source.cols) {
            continue;
        }
        values[variable.name] = toJsonArray(applyDownsample(extractColumn(source, variable.column), plan));
    }
    results["variables"] = std::move(values);
    return results;
}

nlohmann::json serializeTimeDomainVariables(const ModelInstance& model) {
    if (!model.timeDomainStatus().initialized) {
        return {{"initialized", false}, {"error", "Time-domain simulation not initialized"}};
    }
    const auto& stateNames = model.stateNames();
    const auto& algebraicNames = model.algebraicNames();
    return {{"state_variables", toJsonArray(stateNames)},
            {"algebraic_variables", toJsonArray(algebraicNames)},
            {"n_states", stateNames.size()},
            {"n_algebraic", algebraicNames.size()}};
}

nlohmann::json serializeEigenResults(const ModelInstance& model) {
    const std::optional<EigenResult> eig = model.eigenResult();
    if (!eig || eig->eigenvalues.empty()) {
        return {{"success", false}, {"error", "Eigenvalue analysis has not been run yet"}};
    }

    const ComplexParts parts = splitComplex(eig->eigenvalues);
    std::size_t positive = 0;
    std::size_t zeros = 0;
    std::size_t negative = 0;
    for (const double re : parts.real) {
        if (std::abs(re) <= eig->zeroTolerance) {
            ++zeros;
        } else if (re > 0.0) {
            ++positive;
        } else {
            ++negative;
        }
    }

    nlohmann::json results;
    results["n_eigenvalues"] = eig->eigenvalues.size();
    results["eigenvalues"] = {{"real", toJsonArray(parts.real)}, {"imag", toJsonArray(parts.imag)}};
    results["statistics"] = {{"n_positive", positive}, {"n_zeros", zeros}, {"n_negative", negative}};
    if (eig->participation && !eig->participation->empty()) {
        results["participation_factors"] = toJsonMatrix(*eig->participation);
    }
    if (!eig->stateNames.empty()) {
        results["state_names"] = toJsonArray(eig->stateNames);
    }
    results["exec_time"] = toJsonScalar(eig->execTime);
    return results;
}

}  // namespace powersim
