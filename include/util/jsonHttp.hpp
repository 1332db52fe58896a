#pragma once

#include "util/curlWrappers.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace cs::util {

// One JSON request/response exchange. Transport errors and HTTP statuses are
// both left in the returned HttpResponse for the caller to judge.
HttpResponse sendJson(const std::string& method,
                      const std::string& url,
                      const std::vector<std::string>& extraHeaders,
                      const std::string& body,
                      std::chrono::seconds timeout);

}
