// filename: engine.hpp
// part of Power System Session Server
// MIT License

#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace powersim {

/**
 * @brief Raised by engine adapters when a load or an analysis fails.
 */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Device identifiers are either integers or strings depending on the case file.
using ElementId = std::variant<std::int64_t, std::string>;

/**
 * @brief Row-major dense matrix as handed out by the engine.
 */
struct DenseMatrix {
    std::size_t rows{0};
    std::size_t cols{0};
    std::vector<double> data;

    DenseMatrix() = default;

    DenseMatrix(std::size_t rowsIn, std::size_t colsIn)
        : rows(rowsIn), cols(colsIn), data(rowsIn * colsIn, 0.0) {}

    [[nodiscard]] inline std::size_t idx(std::size_t r, std::size_t c) const { return r * cols + c; }

    [[nodiscard]] inline double& at(std::size_t r, std::size_t c) {
        if (r >= rows || c >= cols) {
            throw std::out_of_range("DenseMatrix::at index out of range");
        }
        return data[idx(r, c)];
    }

    [[nodiscard]] inline const double& at(std::size_t r, std::size_t c) const {
        if (r >= rows || c >= cols) {
            throw std::out_of_range("DenseMatrix::at index out of range");
        }
        return data[idx(r, c)];
    }

    [[nodiscard]] bool empty() const { return rows == 0 || cols == 0; }
};

struct LoadOptions {
    bool setup{true};
    bool noOutput{true};
};

struct PowerFlowOptions {
    std::optional<double> tol;
    std::optional<int> maxIter;
    std::optional<std::string> method;
};

struct TimeDomainOptions {
    double tf{0.0};
    std::optional<double> tstep;
    std::optional<double> tol;
    std::optional<std::string> method;
};

struct ComponentInfo {
    std::string type;
    std::string group;
    std::size_t count{0};
};

struct DaeShape {
    std::size_t nStates{0};
    std::size_t nAlgebraic{0};
    double time{0.0};
};

struct SystemConfig {
    double frequency{60.0};
    double powerBase{100.0};
};

struct PowerFlowStatus {
    bool converged{false};
    std::size_t iterations{0};
    double execTime{0.0};
};

struct BusTable {
    std::vector<ElementId> idx;
    std::vector<std::string> name;
    std::vector<double> voltage;
    std::vector<double> angle;
};

// Active/reactive injections of one device type (Slack, PV, PQ, ...).
struct InjectionTable {
    std::vector<ElementId> idx;
    std::vector<double> p;
    std::vector<double> q;
};

struct TimeDomainStatus {
    bool initialized{false};
    bool busted{false};
    double execTime{0.0};
    double t0{0.0};
    double tf{0.0};
};

/**
 * @brief Recorded DAE trajectory: one row per time step, one column per variable.
 */
struct TimeSeries {
    std::vector<double> t;
    DenseMatrix x;
    DenseMatrix y;
};

struct EigenResult {
    std::vector<std::complex<double>> eigenvalues;
    std::optional<DenseMatrix> participation;
    std::vector<std::string> stateNames;
    double zeroTolerance{1e-6};
    double execTime{0.0};
};

/**
 * @brief Capability contract the session layer requires from one loaded model.
 *
 * Implementations are stateful and not reentrant; callers serialise access.
 * Analysis entry points throw EngineError on failure.
 */
class ModelInstance {
public:
    virtual ~ModelInstance() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string casePath() const = 0;
    [[nodiscard]] virtual bool isSetup() const = 0;
    [[nodiscard]] virtual std::vector<ComponentInfo> components() const = 0;
    [[nodiscard]] virtual DaeShape daeShape() const = 0;
    [[nodiscard]] virtual SystemConfig config() const = 0;

    virtual bool runPowerFlow(const PowerFlowOptions& options) = 0;
    [[nodiscard]] virtual PowerFlowStatus powerFlowStatus() const = 0;
    [[nodiscard]] virtual BusTable buses() const = 0;
    // Empty table when the model has no device of that type.
    [[nodiscard]] virtual InjectionTable injections(const std::string& deviceType) const = 0;

    virtual bool runTimeDomain(const TimeDomainOptions& options) = 0;
    [[nodiscard]] virtual TimeDomainStatus timeDomainStatus() const = 0;
    [[nodiscard]] virtual const TimeSeries& timeSeries() const = 0;
    [[nodiscard]] virtual const std::vector<std::string>& stateNames() const = 0;
    [[nodiscard]] virtual const std::vector<std::string>& algebraicNames() const = 0;

    virtual void runEigen() = 0;
    // std::nullopt until runEigen() has produced eigenvalues.
    [[nodiscard]] virtual std::optional<EigenResult> eigenResult() const = 0;
};

/**
 * @brief Factory for model instances.
 *
 * load() returns a fully constructed model or throws EngineError; any partially
 * built state is released before the exception leaves the adapter. load() may
 * be called from several threads at once.
 */
class Engine {
public:
    virtual ~Engine() = default;

    virtual std::unique_ptr<ModelInstance> load(const std::string& path, const LoadOptions& options) = 0;

    // Lower-case file extensions (".json") the adapter can load.
    [[nodiscard]] virtual std::vector<std::string> supportedExtensions() const = 0;
};

}  // namespace powersim
