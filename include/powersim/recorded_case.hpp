#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "powersim/engine.hpp"

namespace powersim {

/**
 * @brief A case file carrying a network description and recorded analysis results.
 *
 * Produced by an offline solver run; replayed by RecordedModel so the session
 * server can be exercised without linking a numerical engine.
 */
struct RecordedCase {
    struct Bus {
        ElementId idx;
        std::string name;
        double v0{1.0};
        double a0{0.0};
    };

    struct PowerFlow {
        bool converged{false};
        std::size_t iterations{0};
        double execTime{0.0};
        std::vector<double> voltage;
        std::vector<double> angle;
        std::map<std::string, InjectionTable> injections;
    };

    struct TimeDomain {
        double t0{0.0};
        double execTime{0.0};
        bool busted{false};
        std::vector<std::string> stateNames;
        std::vector<std::string> algebraicNames;
        TimeSeries series;
    };

    std::string version;
    std::string name;
    SystemConfig config;
    std::vector<ComponentInfo> components;
    std::vector<Bus> buses;
    std::optional<PowerFlow> powerFlow;
    std::optional<TimeDomain> timeDomain;
    std::optional<EigenResult> eigen;
};

RecordedCase loadRecordedCaseFromJson(const std::string& path);

/**
 * @brief ModelInstance replaying a RecordedCase.
 */
class RecordedModel : public ModelInstance {
public:
    RecordedModel(RecordedCase recorded, std::string casePath, const LoadOptions& options);

    [[nodiscard]] std::string name() const override { return case_.name; }
    [[nodiscard]] std::string casePath() const override { return casePath_; }
    [[nodiscard]] bool isSetup() const override { return setup_; }
    [[nodiscard]] std::vector<ComponentInfo> components() const override { return case_.components; }
    [[nodiscard]] DaeShape daeShape() const override;
    [[nodiscard]] SystemConfig config() const override { return case_.config; }

    bool runPowerFlow(const PowerFlowOptions& options) override;
    [[nodiscard]] PowerFlowStatus powerFlowStatus() const override { return pflow_; }
    [[nodiscard]] BusTable buses() const override;
    [[nodiscard]] InjectionTable injections(const std::string& deviceType) const override;

    bool runTimeDomain(const TimeDomainOptions& options) override;
    [[nodiscard]] TimeDomainStatus timeDomainStatus() const override { return tds_; }
    [[nodiscard]] const TimeSeries& timeSeries() const override { return series_; }
    [[nodiscard]] const std::vector<std::string>& stateNames() const override { return stateNames_; }
    [[nodiscard]] const std::vector<std::string>& algebraicNames() const override { return algebraicNames_; }

    void runEigen() override;
    [[nodiscard]] std::optional<EigenResult> eigenResult() const override { return eigen_; }

    struct PowerFlowConfig {
        double tol{1e-6};
        int maxIter{25};
        std::string method{"NR"};
    };

    struct TimeDomainConfig {
        double tf{20.0};
        double tstep{1.0 / 30.0};
        double tol{1e-4};
        std::string method{"trapezoid"};
    };

    [[nodiscard]] const PowerFlowConfig& powerFlowConfig() const { return pflowConfig_; }
    [[nodiscard]] const TimeDomainConfig& timeDomainConfig() const { return tdsConfig_; }

private:
    void requireSetup() const;
    void resetDynamicResults();

    RecordedCase case_;
    std::string casePath_;
    bool setup_{false};

    PowerFlowConfig pflowConfig_;
    TimeDomainConfig tdsConfig_;

    bool pflowRun_{false};
    PowerFlowStatus pflow_;
    TimeDomainStatus tds_;
    TimeSeries series_;
    std::vector<std::string> stateNames_;
    std::vector<std::string> algebraicNames_;
    double currentTime_{0.0};
    std::optional<EigenResult> eigen_;
};

class RecordedCaseEngine : public Engine {
public:
    std::unique_ptr<ModelInstance> load(const std::string& path, const LoadOptions& options) override;

    [[nodiscard]] std::vector<std::string> supportedExtensions() const override { return {".json"}; }
};

}  // namespace powersim
