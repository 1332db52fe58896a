#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cs::util {

std::string url_decode(const std::string& value);

// "/api/workspaces/7/sync?x=1" -> {"api", "workspaces", "7", "sync"}
std::vector<std::string> split_path(std::string_view target);

}
