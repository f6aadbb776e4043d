#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <random>
#include <sstream>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        spdlog::warn("ignoring non-integer {}={}", key, v);
        return def;
    }
}

double getenv_double(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        spdlog::warn("ignoring non-numeric {}={}", key, v);
        return def;
    }
}

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso8601_utc(std::int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    int millis = static_cast<int>(epoch_ms % 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

std::string gen_uuid() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t a = dist(rng), b = dist(rng);
    a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (unsigned long long)(a >> 32),
                  (unsigned long long)((a >> 16) & 0xffff),
                  (unsigned long long)(a & 0xffff),
                  (unsigned long long)(b >> 48),
                  (unsigned long long)(b & 0xffffffffffffULL));
    return std::string(buf);
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::map<std::string, std::string> parse_kv_list(const std::string& text) {
    std::map<std::string, std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) continue;
        std::string k = to_lower(trim(item.substr(0, eq)));
        std::string v = trim(item.substr(eq + 1));
        if (k.empty() || v.empty()) continue;
        out[k] = v;
    }
    return out;
}
