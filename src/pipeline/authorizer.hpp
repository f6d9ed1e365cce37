#pragma once

#include <string>

namespace optick {

// Extracts the stream endpoint from an authorize response body. Throws
// AuthError carrying the server's error payload when it is missing.
std::string parse_authorize_response(unsigned status, const std::string& body);

// One-shot bearer credential -> stream URL exchange over HTTPS. Never retries.
class HttpsAuthorizer {
public:
    explicit HttpsAuthorizer(std::string authorize_url, bool verify_peer = true);

    // Throws AuthError (rejected credential / unexpected response) or
    // ConnectionError (endpoint unreachable).
    std::string authorize(const std::string& credential) const;

private:
    std::string authorize_url_;
    bool verify_peer_;
};

} // namespace optick
