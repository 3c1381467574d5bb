#include "powersim/serialization.hpp"

#include "fake_model.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using nlohmann::json;
using powersim_test::FakeModel;
using powersim_test::FakeModelProbe;
using powersim_test::FakeModelSetup;

bool checkSystemInfo() {
    FakeModelSetup setup;
    setup.name = "";
    FakeModel model(setup, std::make_shared<FakeModelProbe>());
    const json info = powersim::serializeSystemInfo(model);

    if (info.at("name") != "Untitled" || info.at("case_path") != "fake.json" || info.at("is_setup") != true) {
        std::cerr << "System identity fields unexpected: " << info.dump() << '\n';
        return false;
    }
    const json& models = info.at("models");
    if (models.size() != 3 || models.contains("Toggle") || models.at("PV").at("group") != "StaticGen" ||
        models.at("Bus").at("count") != 2) {
        std::cerr << "Component summary should list only types with instances: " << models.dump() << '\n';
        return false;
    }
    if (info.at("dae_info").at("n_states") != 2 || info.at("dae_info").at("n_algebraic") != 1 ||
        info.at("config").at("freq") != 60.0 || info.at("config").at("mva") != 100.0) {
        std::cerr << "DAE or config summary unexpected: " << info.dump() << '\n';
        return false;
    }
    return true;
}

bool checkPowerFlow() {
    FakeModel model(FakeModelSetup{}, std::make_shared<FakeModelProbe>());
    model.runPowerFlow({});
    const json pf = powersim::serializePowerFlowResults(model);

    if (pf.at("converged") != true || pf.at("iterations") != 3 || !pf.contains("exec_time")) {
        std::cerr << "Power flow status fields unexpected: " << pf.dump() << '\n';
        return false;
    }
    const json& buses = pf.at("buses");
    if (buses.at("idx") != json::parse("[1, \"B2\"]") || buses.at("voltage") != json::parse("[1.0, 0.98]") ||
        buses.at("name").size() != 2) {
        std::cerr << "Bus arrays unexpected: " << buses.dump() << '\n';
        return false;
    }
    // Slack before PV regardless of how the model reports them.
    const json& gens = pf.at("generators");
    if (gens.at("idx") != json::parse("[1, 2]") || gens.at("p") != json::parse("[1.2, 0.5]") ||
        gens.at("q") != json::parse("[0.3, 0.1]")) {
        std::cerr << "Generator aggregation order unexpected: " << gens.dump() << '\n';
        return false;
    }
    if (!pf.at("summary").is_object()) {
        std::cerr << "Summary should be an object\n";
        return false;
    }

    FakeModelSetup diverging;
    diverging.powerFlowConverges = false;
    FakeModel failed(diverging, std::make_shared<FakeModelProbe>());
    failed.runPowerFlow({});
    const json bad = powersim::serializePowerFlowResults(failed);
    if (bad.at("converged") != false || bad.contains("buses") || bad.contains("generators") ||
        bad.at("iterations") != 20) {
        std::cerr << "Non-converged power flow must not carry arrays: " << bad.dump() << '\n';
        return false;
    }
    return true;
}

bool checkTimeDomain() {
    FakeModelSetup setup;
    setup.samples = 1000;
    FakeModel model(setup, std::make_shared<FakeModelProbe>());

    const json before = powersim::serializeTimeDomainResults(model, std::nullopt, 100);
    if (before.at("initialized") != false || !before.contains("error")) {
        std::cerr << "Uninitialized time domain should be reported: " << before.dump() << '\n';
        return false;
    }

    powersim::TimeDomainOptions options{};
    options.tf = 99.9;
    model.runTimeDomain(options);

    const json all = powersim::serializeTimeDomainResults(model, std::nullopt, 100);
    if (all.at("n_points") != 1000 || all.at("downsampled") != true || all.at("downsample_factor") != 10 ||
        all.at("time").size() != 100) {
        std::cerr << "Downsampled trajectory shape unexpected\n";
        return false;
    }
    const json& vars = all.at("variables");
    if (vars.size() != 2 || !vars.contains("delta") || !vars.contains("omega") || vars.contains("v")) {
        std::cerr << "Default selection should be every state variable: " << vars.dump() << '\n';
        return false;
    }
    if (vars.at("omega").size() != 100 || vars.at("omega")[0] != 100.0 || vars.at("omega")[1] != 110.0 ||
        vars.at("omega")[99] != 1090.0) {
        std::cerr << "Variable samples do not follow the stride\n";
        return false;
    }

    const std::vector<std::string> wanted{"v", "omega", "missing", "v"};
    const json some = powersim::serializeTimeDomainResults(model, wanted, 0);
    const json& picked = some.at("variables");
    if (some.at("downsampled") != false || some.contains("downsample_factor") || picked.size() != 2 ||
        picked.contains("missing") || picked.at("v").size() != 1000 || picked.at("v")[3] != -3.0) {
        std::cerr << "Explicit selection unexpected: downsampled=" << some.at("downsampled") << " keys="
                  << picked.size() << '\n';
        return false;
    }

    const json listing = powersim::serializeTimeDomainVariables(model);
    if (listing.at("state_variables") != json::parse("[\"delta\", \"omega\"]") ||
        listing.at("algebraic_variables") != json::parse("[\"v\"]") || listing.at("n_states") != 2 ||
        listing.at("n_algebraic") != 1) {
        std::cerr << "Variable listing unexpected: " << listing.dump() << '\n';
        return false;
    }
    return true;
}

bool checkEigen() {
    FakeModelSetup setup;
    setup.eigenvalues = {{-0.5, 6.2}, {-0.5, -6.2}, {0.0, 0.0}, {1e-9, 0.0}, {0.3, 0.0}};
    FakeModel model(setup, std::make_shared<FakeModelProbe>());

    const json none = powersim::serializeEigenResults(model);
    if (none.at("success") != false) {
        std::cerr << "Eigen results before a run should be a failure marker\n";
        return false;
    }

    model.runEigen();
    const json eig = powersim::serializeEigenResults(model);
    const json& stats = eig.at("statistics");
    if (eig.at("n_eigenvalues") != 5 || stats.at("n_positive") != 1 || stats.at("n_zeros") != 2 ||
        stats.at("n_negative") != 2) {
        std::cerr << "Eigenvalue classification unexpected: " << eig.dump() << '\n';
        return false;
    }
    if (eig.at("eigenvalues").at("imag")[1] != -6.2 || eig.contains("participation_factors") ||
        eig.at("state_names").size() != 2) {
        std::cerr << "Eigenvalue arrays unexpected: " << eig.dump() << '\n';
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!checkSystemInfo()) {
        return 1;
    }
    if (!checkPowerFlow()) {
        return 1;
    }
    if (!checkTimeDomain()) {
        return 1;
    }
    if (!checkEigen()) {
        return 1;
    }
    return 0;
}
