#include "util/parse.hpp"

#include <sstream>
#include <stdexcept>

namespace cs::util {

std::string url_decode(const std::string& value) {
    std::ostringstream result;
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%' && i + 2 < value.length()) {
            if (int hex = 0; std::istringstream(value.substr(i + 1, 2)) >> std::hex >> hex) {
                result << static_cast<char>(hex);
                i += 2;
            } else throw std::runtime_error("Invalid percent-encoding in URL");
        }
        else if (value[i] == '+') result << ' ';
        else result << value[i];
    }
    return result.str();
}

std::vector<std::string> split_path(std::string_view target) {
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    std::vector<std::string> segments;
    while (!target.empty()) {
        const auto slash = target.find('/');
        const auto seg = target.substr(0, slash);
        if (!seg.empty()) segments.emplace_back(url_decode(std::string(seg)));
        if (slash == std::string_view::npos) break;
        target.remove_prefix(slash + 1);
    }
    return segments;
}

}
