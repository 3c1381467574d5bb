#include "powersim/recorded_case.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace powersim {
namespace {
constexpr double kTimeEpsilon = 1e-9;

double requirePositive(const std::string& field, double value) {
    if (!(value > 0.0)) {
        throw std::runtime_error(field + " must be positive");
    }
    return value;
}

std::string requireNonEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error(field + " must be a non-empty string");
    }
    return value;
}

ElementId parseElementId(const std::string& field, const nlohmann::json& node) {
    if (node.is_number_integer()) {
        return ElementId{node.get<std::int64_t>()};
    }
    if (node.is_string()) {
        return ElementId{node.get<std::string>()};
    }
    throw std::runtime_error(field + " must be an integer or a string");
}

std::vector<double> parseNumberArray(const std::string& field, const nlohmann::json& node) {
    if (!node.is_array()) {
        throw std::runtime_error(field + " must be an array of numbers");
    }
    std::vector<double> values;
    values.reserve(node.size());
    for (const auto& item : node) {
        if (item.is_null()) {
            values.push_back(std::numeric_limits<double>::quiet_NaN());
        } else if (item.is_number()) {
            values.push_back(item.get<double>());
        } else {
            throw std::runtime_error(field + " must contain only numbers");
        }
    }
    return values;
}

std::vector<std::string> parseStringArray(const std::string& field, const nlohmann::json& node) {
    if (!node.is_array()) {
        throw std::runtime_error(field + " must be an array of strings");
    }
    std::vector<std::string> values;
    values.reserve(node.size());
    std::unordered_set<std::string> seen;
    for (const auto& item : node) {
        const std::string value = requireNonEmpty(field + " entry", item.get<std::string>());
        if (!seen.insert(value).second) {
            throw std::runtime_error("Duplicate name in " + field + ": " + value);
        }
        values.push_back(value);
    }
    return values;
}

DenseMatrix parseRowMatrix(const std::string& field, const nlohmann::json& node, std::size_t cols) {
    if (!node.is_array()) {
        throw std::runtime_error(field + " must be an array of rows");
    }
    DenseMatrix matrix(node.size(), cols);
    for (std::size_t r = 0; r < node.size(); ++r) {
        const std::vector<double> row = parseNumberArray(field + "[" + std::to_string(r) + "]", node[r]);
        if (row.size() != cols) {
            throw std::runtime_error(field + "[" + std::to_string(r) + "] must have " + std::to_string(cols) +
                                     " entries");
        }
        std::copy(row.begin(), row.end(), matrix.data.begin() + static_cast<std::ptrdiff_t>(matrix.idx(r, 0)));
    }
    return matrix;
}

InjectionTable parseInjectionTable(const std::string& field, const nlohmann::json& node) {
    InjectionTable table;
    const auto& ids = node.at("idx");
    if (!ids.is_array()) {
        throw std::runtime_error(field + ".idx must be an array");
    }
    for (std::size_t i = 0; i < ids.size(); ++i) {
        table.idx.push_back(parseElementId(field + ".idx[" + std::to_string(i) + "]", ids[i]));
    }
    table.p = parseNumberArray(field + ".p", node.at("p"));
    table.q = parseNumberArray(field + ".q", node.at("q"));
    if (table.p.size() != table.idx.size() || table.q.size() != table.idx.size()) {
        throw std::runtime_error(field + " arrays must have matching lengths");
    }
    return table;
}

RecordedCase::PowerFlow parsePowerFlow(const nlohmann::json& node, std::size_t busCount) {
    RecordedCase::PowerFlow pf{};
    pf.converged = node.at("converged").get<bool>();
    const int iterations = node.at("iterations").get<int>();
    if (iterations < 0) {
        throw std::runtime_error("power_flow.iterations must be non-negative");
    }
    pf.iterations = static_cast<std::size_t>(iterations);
    pf.execTime = node.value("exec_time", 0.0);
    if (!pf.converged) {
        return pf;
    }

    pf.voltage = parseNumberArray("power_flow.voltage", node.at("voltage"));
    pf.angle = parseNumberArray("power_flow.angle", node.at("angle"));
    if (pf.voltage.size() != busCount || pf.angle.size() != busCount) {
        throw std::runtime_error("power_flow voltage/angle arrays must have one entry per bus");
    }
    if (node.contains("injections")) {
        const auto& injections = node.at("injections");
        if (!injections.is_object()) {
            throw std::runtime_error("power_flow.injections must be an object keyed by device type");
        }
        for (auto it = injections.begin(); it != injections.end(); ++it) {
            pf.injections.emplace(it.key(), parseInjectionTable("power_flow.injections." + it.key(), it.value()));
        }
    }
    return pf;
}

RecordedCase::TimeDomain parseTimeDomain(const nlohmann::json& node) {
    RecordedCase::TimeDomain td{};
    td.t0 = node.value("t0", 0.0);
    td.execTime = node.value("exec_time", 0.0);
    td.busted = node.value("busted", false);
    td.stateNames = parseStringArray("time_domain.state_names", node.at("state_names"));
    td.algebraicNames = parseStringArray("time_domain.algebraic_names", node.at("algebraic_names"));
    td.series.t = parseNumberArray("time_domain.t", node.at("t"));
    for (std::size_t i = 1; i < td.series.t.size(); ++i) {
        if (!(td.series.t[i] > td.series.t[i - 1])) {
            throw std::runtime_error("time_domain.t must be strictly increasing");
        }
    }
    td.series.x = parseRowMatrix("time_domain.x", node.at("x"), td.stateNames.size());
    td.series.y = parseRowMatrix("time_domain.y", node.at("y"), td.algebraicNames.size());
    if (td.series.x.rows != td.series.t.size() || td.series.y.rows != td.series.t.size()) {
        throw std::runtime_error("time_domain.x and time_domain.y must have one row per time sample");
    }
    return td;
}

EigenResult parseEigen(const nlohmann::json& node) {
    EigenResult eig{};
    eig.execTime = node.value("exec_time", 0.0);
    eig.zeroTolerance = node.value("zero_tolerance", 1e-6);
    if (eig.zeroTolerance < 0.0) {
        throw std::runtime_error("eigen.zero_tolerance must be non-negative");
    }
    const auto& values = node.at("eigenvalues");
    if (!values.is_array()) {
        throw std::runtime_error("eigen.eigenvalues must be an array of [real, imag] pairs");
    }
    for (const auto& pair : values) {
        if (!pair.is_array() || pair.size() != 2) {
            throw std::runtime_error("eigen.eigenvalues entries must be [real, imag] pairs");
        }
        eig.eigenvalues.emplace_back(pair[0].get<double>(), pair[1].get<double>());
    }
    if (node.contains("state_names")) {
        eig.stateNames = parseStringArray("eigen.state_names", node.at("state_names"));
    }
    if (node.contains("participation")) {
        const auto& rows = node.at("participation");
        const std::size_t cols = rows.empty() ? 0 : rows.front().size();
        eig.participation = parseRowMatrix("eigen.participation", rows, cols);
    }
    return eig;
}

}  // namespace

RecordedCase loadRecordedCaseFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open case file: " + path);
    }

    nlohmann::json json;
    input >> json;

    RecordedCase rc{};
    rc.version = json.value("version", std::string{});
    if (rc.version.empty()) {
        throw std::runtime_error("Case JSON missing required field: version");
    }
    if (rc.version != "0.1") {
        throw std::runtime_error("Unsupported case version: " + rc.version);
    }
    rc.name = json.value("name", std::string{});

    if (json.contains("config")) {
        const auto& config = json.at("config");
        rc.config.frequency = requirePositive("config.freq", config.value("freq", 60.0));
        rc.config.powerBase = requirePositive("config.mva", config.value("mva", 100.0));
    }

    std::unordered_set<std::string> componentTypes;
    for (const auto& component : json.value("components", nlohmann::json::array())) {
        ComponentInfo info{};
        info.type = requireNonEmpty("components.type", component.at("type").get<std::string>());
        info.group = component.value("group", std::string{});
        const int count = component.at("count").get<int>();
        if (count < 0) {
            throw std::runtime_error("components.count must be non-negative for " + info.type);
        }
        info.count = static_cast<std::size_t>(count);
        if (!componentTypes.insert(info.type).second) {
            throw std::runtime_error("Duplicate component type: " + info.type);
        }
        rc.components.push_back(info);
    }

    const auto& buses = json.at("buses");
    if (!buses.is_array() || buses.empty()) {
        throw std::runtime_error("Case must define at least one bus");
    }
    for (std::size_t i = 0; i < buses.size(); ++i) {
        const auto& bus = buses[i];
        RecordedCase::Bus entry{parseElementId("buses[" + std::to_string(i) + "].idx", bus.at("idx"))};
        entry.name = bus.value("name", std::string{});
        entry.v0 = bus.value("v0", 1.0);
        entry.a0 = bus.value("a0", 0.0);
        rc.buses.push_back(entry);
    }

    if (json.contains("power_flow")) {
        rc.powerFlow = parsePowerFlow(json.at("power_flow"), rc.buses.size());
    }
    if (json.contains("time_domain")) {
        rc.timeDomain = parseTimeDomain(json.at("time_domain"));
    }
    if (json.contains("eigen")) {
        rc.eigen = parseEigen(json.at("eigen"));
    }
    return rc;
}

RecordedModel::RecordedModel(RecordedCase recorded, std::string casePath, const LoadOptions& options)
    : case_(std::move(recorded)), casePath_(std::move(casePath)), setup_(options.setup) {
    if (setup_ && case_.timeDomain) {
        stateNames_ = case_.timeDomain->stateNames;
        algebraicNames_ = case_.timeDomain->algebraicNames;
    }
}

DaeShape RecordedModel::daeShape() const {
    DaeShape shape{};
    shape.nStates = stateNames_.size();
    shape.nAlgebraic = algebraicNames_.size();
    shape.time = currentTime_;
    return shape;
}

void RecordedModel::requireSetup() const {
    if (!setup_) {
        throw EngineError("System is not set up");
    }
}

void RecordedModel::resetDynamicResults() {
    tds_ = TimeDomainStatus{};
    series_ = TimeSeries{};
    currentTime_ = 0.0;
    eigen_.reset();
}

bool RecordedModel::runPowerFlow(const PowerFlowOptions& options) {
    requireSetup();
    PowerFlowConfig config = pflowConfig_;
    if (options.tol) {
        if (!(*options.tol > 0.0)) {
            throw EngineError("Power flow tolerance must be positive");
        }
        config.tol = *options.tol;
    }
    if (options.maxIter) {
        if (*options.maxIter <= 0) {
            throw EngineError("Power flow max_iter must be positive");
        }
        config.maxIter = *options.maxIter;
    }
    if (options.method) {
        const std::string& method = *options.method;
        if (method != "NR" && method != "dishonest" && method != "NK") {
            throw EngineError("Unsupported power flow method: " + method);
        }
        config.method = method;
    }
    if (!case_.powerFlow) {
        throw EngineError("Case carries no power flow recording");
    }
    pflowConfig_ = config;

    resetDynamicResults();
    pflowRun_ = true;
    const auto& recorded = *case_.powerFlow;
    const std::size_t limit = static_cast<std::size_t>(pflowConfig_.maxIter);
    pflow_.converged = recorded.converged && recorded.iterations <= limit;
    pflow_.iterations = std::min(recorded.iterations, limit);
    pflow_.execTime = recorded.execTime;
    return pflow_.converged;
}

BusTable RecordedModel::buses() const {
    BusTable table;
    const bool solved = pflowRun_ && pflow_.converged;
    for (std::size_t i = 0; i < case_.buses.size(); ++i) {
        const auto& bus = case_.buses[i];
        table.idx.push_back(bus.idx);
        table.name.push_back(bus.name);
        table.voltage.push_back(solved ? case_.powerFlow->voltage[i] : bus.v0);
        table.angle.push_back(solved ? case_.powerFlow->angle[i] : bus.a0);
    }
    return table;
}

InjectionTable RecordedModel::injections(const std::string& deviceType) const {
    if (!pflowRun_ || !pflow_.converged) {
        return {};
    }
    const auto it = case_.powerFlow->injections.find(deviceType);
    if (it == case_.powerFlow->injections.end()) {
        return {};
    }
    return it->second;
}

bool RecordedModel::runTimeDomain(const TimeDomainOptions& options) {
    requireSetup();
    if (!pflowRun_ || !pflow_.converged) {
        throw EngineError("Power flow has not converged");
    }
    if (!case_.timeDomain) {
        throw EngineError("Case carries no time-domain recording");
    }
    const auto& recorded = *case_.timeDomain;

    TimeDomainConfig config = tdsConfig_;
    if (!(options.tf > recorded.t0)) {
        throw EngineError("Simulation end time must be greater than the start time");
    }
    config.tf = options.tf;
    if (options.tstep) {
        if (!(*options.tstep > 0.0)) {
            throw EngineError("Time step must be positive");
        }
        config.tstep = *options.tstep;
    }
    if (options.tol) {
        if (!(*options.tol > 0.0)) {
            throw EngineError("Time-domain tolerance must be positive");
        }
        config.tol = *options.tol;
    }
    if (options.method) {
        const std::string& method = *options.method;
        if (method != "trapezoid" && method != "backeuler") {
            throw EngineError("Unsupported integration method: " + method);
        }
        config.method = method;
    }
    const double recordedEnd = recorded.series.t.empty() ? recorded.t0 : recorded.series.t.back();
    if (config.tf > recordedEnd + kTimeEpsilon) {
        throw EngineError("Requested end time " + std::to_string(config.tf) +
                          " exceeds the recorded trajectory end " + std::to_string(recordedEnd));
    }
    tdsConfig_ = config;

    std::size_t keep = 0;
    while (keep < recorded.series.t.size() && recorded.series.t[keep] <= config.tf + kTimeEpsilon) {
        ++keep;
    }

    series_ = TimeSeries{};
    series_.t.assign(recorded.series.t.begin(), recorded.series.t.begin() + static_cast<std::ptrdiff_t>(keep));
    series_.x = DenseMatrix(keep, recorded.series.x.cols);
    std::copy(recorded.series.x.data.begin(),
              recorded.series.x.data.begin() + static_cast<std::ptrdiff_t>(keep * recorded.series.x.cols),
              series_.x.data.begin());
    series_.y = DenseMatrix(keep, recorded.series.y.cols);
    std::copy(recorded.series.y.data.begin(),
              recorded.series.y.data.begin() + static_cast<std::ptrdiff_t>(keep * recorded.series.y.cols),
              series_.y.data.begin());

    tds_.initialized = true;
    tds_.busted = recorded.busted;
    tds_.execTime = recorded.execTime;
    tds_.t0 = recorded.t0;
    tds_.tf = config.tf;
    currentTime_ = series_.t.empty() ? recorded.t0 : series_.t.back();
    return !recorded.busted;
}

void RecordedModel::runEigen() {
    requireSetup();
    if (!pflowRun_ || !pflow_.converged) {
        throw EngineError("Power flow has not converged");
    }
    if (!case_.eigen) {
        throw EngineError("Case carries no eigenvalue recording");
    }
    eigen_ = case_.eigen;
}

std::unique_ptr<ModelInstance> RecordedCaseEngine::load(const std::string& path, const LoadOptions& options) {
    try {
        RecordedCase recorded = loadRecordedCaseFromJson(path);
        return std::make_unique<RecordedModel>(std::move(recorded), path, options);
    } catch (const nlohmann::json::exception& ex) {
        throw EngineError("Malformed case file " + path + ": " + ex.what());
    } catch (const std::runtime_error& ex) {
        throw EngineError("Failed to load case " + path + ": " + ex.what());
    }
}

}  // namespace powersim
