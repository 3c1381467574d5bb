#include "powersim/catalog.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace powersim {
namespace {

std::string toLower(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (unsigned char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lower;
}

}  // namespace

CaseCatalog::CaseCatalog(std::filesystem::path casesDir, std::vector<std::string> extensions)
    : casesDir_(std::move(casesDir)), extensions_(std::move(extensions)) {
    for (auto& ext : extensions_) {
        ext = toLower(ext);
    }
}

bool CaseCatalog::hasSupportedExtension(const std::filesystem::path& path) const {
    const std::string ext = toLower(path.extension().string());
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::vector<std::string> CaseCatalog::listCases() const {
    namespace fs = std::filesystem;
    std::vector<std::string> cases;
    std::error_code ec;
    if (!fs::is_directory(casesDir_, ec)) {
        return cases;
    }

    fs::recursive_directory_iterator it(casesDir_, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        if (it->is_regular_file(ec) && hasSupportedExtension(it->path())) {
            cases.push_back(it->path().lexically_relative(casesDir_).generic_string());
        }
        it.increment(ec);
    }
    std::sort(cases.begin(), cases.end());
    return cases;
}

std::optional<std::filesystem::path> CaseCatalog::resolve(const std::string& name) const {
    namespace fs = std::filesystem;
    if (name.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const fs::path bundled = casesDir_ / name;
    if (fs::is_regular_file(bundled, ec)) {
        return bundled.lexically_normal();
    }
    const fs::path direct(name);
    if (fs::is_regular_file(direct, ec)) {
        return direct;
    }
    return std::nullopt;
}

}  // namespace powersim
