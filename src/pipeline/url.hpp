#pragma once

#include <optional>
#include <string>

namespace optick {

struct Url {
    std::string scheme;     // "wss", "ws", "https", "http"
    std::string host;
    std::string port;
    std::string target;     // path + query, at least "/"

    bool secure() const { return scheme == "wss" || scheme == "https"; }
};

inline std::optional<Url> parse_url(const std::string& text) {
    const auto sep = text.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    Url url;
    url.scheme = text.substr(0, sep);
    if (url.scheme != "ws" && url.scheme != "wss" && url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    const auto host_begin = sep + 3;
    const auto path_begin = text.find_first_of("/?", host_begin);
    std::string authority = text.substr(host_begin, path_begin == std::string::npos
                                                        ? std::string::npos
                                                        : path_begin - host_begin);
    url.target = path_begin == std::string::npos ? "/" : text.substr(path_begin);
    if (url.target[0] == '?') url.target.insert(0, "/");

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
        url.port = url.secure() ? "443" : "80";
    }

    if (url.host.empty() || url.port.empty()) return std::nullopt;
    return url;
}

} // namespace optick
