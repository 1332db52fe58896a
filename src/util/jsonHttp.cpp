#include "util/jsonHttp.hpp"

using namespace cs::util;

HttpResponse cs::util::sendJson(const std::string& method, const std::string& url,
                                const std::vector<std::string>& extraHeaders, const std::string& body,
                                const std::chrono::seconds timeout) {
    SList hdrs;
    hdrs.add("Accept: application/json");
    if (!body.empty()) hdrs.add("Content-Type: application/json");
    for (const auto& h : extraHeaders) hdrs.add(h);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        if (!body.empty() || method == "POST") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
    });
}
