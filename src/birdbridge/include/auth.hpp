#pragma once
#include <string>
#include "http_server.hpp"

// Shared-secret check for the local API. The key travels in the X-API-Key
// header or, for browsers, a `key` query parameter.
class Auth {
public:
    // An empty key is replaced by a freshly generated one.
    explicit Auth(std::string api_key);

    bool check_key(const std::string& key) const;
    bool check_request(const HttpRequest& req) const;
    const std::string& key() const { return key_; }
    bool generated() const { return generated_; }

    static std::string new_key();

private:
    std::string key_;
    bool generated_ = false;
};
