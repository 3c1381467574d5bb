#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace powersim {

/**
 * @brief Discovers case files below a directory and resolves caller-supplied names.
 */
class CaseCatalog {
public:
    CaseCatalog(std::filesystem::path casesDir, std::vector<std::string> extensions);

    [[nodiscard]] const std::filesystem::path& casesDir() const { return casesDir_; }

    // Sorted, '/'-separated paths relative to casesDir().
    [[nodiscard]] std::vector<std::string> listCases() const;

    /**
     * @brief Resolve a bundled case name first, then a path as given.
     */
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& name) const;

private:
    [[nodiscard]] bool hasSupportedExtension(const std::filesystem::path& path) const;

    std::filesystem::path casesDir_;
    std::vector<std::string> extensions_;
};

}  // namespace powersim
