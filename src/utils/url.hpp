#pragma once

#include <string>

namespace trialbench::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;

    std::string SchemeHostPort() const {
        return (https ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

// Accepts "scheme://host[:port][/path]"; a missing scheme means https.
// Trailing slashes are dropped from base_path.
inline ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

}  // namespace trialbench::utils
