#pragma once

#include <string>
#include <string_view>

namespace cs::sync::model {

// Workspace paths are absolute and "/" separated, with no empty, "." or ".."
// segments and no trailing slash. Throws ValidationError otherwise.
void validatePath(std::string_view path);

[[nodiscard]] bool isValidPath(std::string_view path) noexcept;

// "dir/a.py" or "./dir/a.py" -> "/dir/a.py"; the result is validated.
std::string toWorkspacePath(std::string_view relative);

}
