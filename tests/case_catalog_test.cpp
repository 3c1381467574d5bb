#include "powersim/catalog.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace powersim;
    namespace fs = std::filesystem;

    const fs::path inputs = (fs::path(__FILE__).parent_path() / "../inputs").lexically_normal();
    const CaseCatalog catalog(inputs / "cases", {".json"});

    const std::vector<std::string> expected{"ieee3/ieee3.json", "two_bus.json"};
    if (catalog.listCases() != expected) {
        std::cerr << "Case listing should hold the two bundled cases and skip other files\n";
        for (const auto& name : catalog.listCases()) {
            std::cerr << "  " << name << '\n';
        }
        return 1;
    }

    // Extensions compare case-insensitively.
    const CaseCatalog upper(inputs / "cases", {".JSON"});
    if (upper.listCases() != expected) {
        std::cerr << "Extension matching should ignore case\n";
        return 1;
    }

    const CaseCatalog missing(inputs / "no_such_dir", {".json"});
    if (!missing.listCases().empty()) {
        std::cerr << "A missing cases directory should list nothing\n";
        return 1;
    }

    const auto bundled = catalog.resolve("ieee3/ieee3.json");
    if (!bundled || *bundled != (inputs / "cases/ieee3/ieee3.json").lexically_normal()) {
        std::cerr << "Bundled case name did not resolve under the cases directory\n";
        return 1;
    }

    const fs::path direct = inputs / "tests/pf_diverging_case.json";
    const auto external = catalog.resolve(direct.string());
    if (!external || *external != direct) {
        std::cerr << "A path outside the cases directory should resolve as given\n";
        return 1;
    }

    if (catalog.resolve("nope.json") || catalog.resolve("") || catalog.resolve("ieee3")) {
        std::cerr << "Missing files and directories must not resolve\n";
        return 1;
    }

    return 0;
}
