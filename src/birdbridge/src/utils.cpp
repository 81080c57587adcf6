#include "utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>

std::string now_timestamp_filename() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}

bool ensure_dir(const std::string& path) {
    struct stat st{};
    if (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) return true;
    // Create missing parents first
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0 && !ensure_dir(path.substr(0, slash))) return false;
    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

std::string to_iso8601(SystemTime t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) { millis += 1000; secs -= 1; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

// "", "Z", "+HH:MM", "-HH:MM", "+HHMM" or "-HHMM"; minutes east of UTC.
static bool parse_utc_offset(const std::string& s, int& minutes) {
    minutes = 0;
    if (s.empty() || s == "Z" || s == "z") return true;
    if (s[0] != '+' && s[0] != '-') return false;
    std::string d = s.substr(1);
    if (d.size() == 5 && d[2] == ':') d.erase(2, 1);
    if (d.size() != 4) return false;
    for (char c : d) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    int h = std::stoi(d.substr(0, 2));
    int m = std::stoi(d.substr(2));
    if (h > 23 || m > 59) return false;
    minutes = (s[0] == '-' ? -1 : 1) * (h * 60 + m);
    return true;
}

std::optional<SystemTime> parse_iso8601(const std::string& s) {
    std::tm tm{};
    int millis = 0;
    std::istringstream iss(s);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    if (iss.peek() == '.') {
        iss.get();
        std::string frac;
        while (std::isdigit(iss.peek())) frac.push_back(static_cast<char>(iss.get()));
        frac = (frac + "000").substr(0, 3);
        millis = std::stoi(frac);
    }

    // Whatever follows must be a zone designator; no zone means UTC.
    std::string rest{std::istreambuf_iterator<char>(iss), std::istreambuf_iterator<char>()};
    int offset_min = 0;
    if (!parse_utc_offset(rest, offset_min)) return std::nullopt;

    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis)
           - std::chrono::minutes(offset_min);
}

std::tm local_tm(SystemTime t) {
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&secs, &tm);
    return tm;
}

std::string local_date(SystemTime t) {
    std::tm tm = local_tm(t);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, sep)) out.push_back(cur);
    if (!s.empty() && s.back() == sep) out.emplace_back();
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '+') { out.push_back(' '); continue; }
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]), lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string query_param(const std::string& query, const std::string& name) {
    for (const auto& pair : split(query, '&')) {
        auto eq = pair.find('=');
        std::string k = pair.substr(0, eq);
        if (url_decode(k) != name) continue;
        return eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
    }
    return std::string();
}

std::string random_token(std::size_t len) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);
    std::string out(len, '0');
    for (auto& c : out) c = digits[dist(gen)];
    return out;
}
