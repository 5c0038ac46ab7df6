#include "http.hpp"

namespace thinkproxy {

std::string HttpResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

bool method_has_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

} // namespace thinkproxy
