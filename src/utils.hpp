#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <random>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace toolguard {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.toolguard/config.json";
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// UTC, millisecond precision: 2026-01-31T12:00:00.000Z
inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

inline std::string to_base36(uint64_t v) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out += digits[v % 36];
        v /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

inline std::string random_base36(size_t len) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) out += digits[dist(rng)];
    return out;
}

} // namespace toolguard
