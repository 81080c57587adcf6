#include "auth.hpp"
#include "config.hpp"
#include <cstdio>
#include <random>

Auth::Auth(std::string api_key) : key_(std::move(api_key)) {
    if (key_.empty()) {
        key_ = new_key();
        generated_ = true;
    }
}

std::string Auth::new_key() {
    std::random_device rd; std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    unsigned long long a = dist(gen), b = dist(gen);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx",
             (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

bool Auth::check_key(const std::string& key) const {
    if (key.size() != key_.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < key.size(); ++i) diff |= key[i] ^ key_[i];
    return diff == 0;
}

bool Auth::check_request(const HttpRequest& req) const {
    std::string k = req.header(cfg::API_KEY_HEADER);
    if (k.empty()) k = req.param("key");
    return check_key(k);
}
