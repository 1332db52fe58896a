#include "sync/model/path.hpp"
#include "sync/Errors.hpp"

namespace cs::sync::model {

namespace {
constexpr size_t MAX_PATH_LENGTH = 1024;

const char* pathProblem(std::string_view path) {
    if (path.empty()) return "path is empty";
    if (path.front() != '/') return "path must start with '/'";
    if (path.size() == 1) return "path must name an entry below the root";
    if (path.size() > MAX_PATH_LENGTH) return "path too long";
    if (path.back() == '/') return "path has a trailing '/'";
    if (path.find('\0') != std::string_view::npos) return "path contains a NUL byte";
    if (path.find('\\') != std::string_view::npos) return "path contains a backslash";

    path.remove_prefix(1);
    while (!path.empty()) {
        const auto slash = path.find('/');
        const auto seg = path.substr(0, slash);
        if (seg.empty()) return "path has an empty segment";
        if (seg == "." || seg == "..") return "path has a relative segment";
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    return nullptr;
}
}

void validatePath(const std::string_view path) {
    if (const auto* problem = pathProblem(path))
        throw ValidationError(std::string("Invalid path '") + std::string(path) + "': " + problem);
}

bool isValidPath(const std::string_view path) noexcept {
    return pathProblem(path) == nullptr;
}

std::string toWorkspacePath(std::string_view relative) {
    while (relative.starts_with("./")) relative.remove_prefix(2);
    while (relative.starts_with('/')) relative.remove_prefix(1);
    std::string out = "/" + std::string(relative);
    validatePath(out);
    return out;
}

}
