#pragma once
#ifdef SOBERLAUNCHER_DEBUG_LOGGING
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Runtime debug logging control
class DebugLogger {
public:
    static bool enabled() {
        static bool enabled = [](){
            const char* env = std::getenv("SOBERLAUNCHER_DEBUG");
            if (env && env[0] == '1') {
                std::cerr << "Debug logging enabled via environment variable" << std::endl;
                return true;
            }
            return false;
        }();
        return enabled;
    }
};

// Default debug_print implementation
template<typename T>
void debug_print(std::ostream& os, const T& value) {
    os << value;
}

// Global log file accessor
inline std::ofstream& debug_log_file() {
    static std::ofstream ofs("/tmp/soberlauncher-debug.log", std::ios::out | std::ios::app);
    return ofs;
}

// Compile-time path stripper
constexpr const char* shorten_path(const char* path) {
    const char* last_slash = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last_slash = p + 1;
    }
    return last_slash;
}

// Strip up to "src/" when present, otherwise keep the basename
constexpr const char* strip_to_repo(const char* path) {
    const char* repo_marker = nullptr;
    for (const char* p = path; *p; ++p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            repo_marker = p;
        }
    }
    return repo_marker ? repo_marker : shorten_path(path);
}

#define __SHORT_FILE__ strip_to_repo(__FILE__)

// Overloads

inline void debug_print(std::ostream& os, const char* value) {
    os << value;
}

inline void debug_print(std::ostream& os, bool value) {
    os << (value ? "true" : "false");
}

inline void debug_print(std::ostream& os, const std::thread::id& tid) {
    std::ostringstream oss;
    oss << tid;
    os << oss.str();
}

// Profile lists and sets print as [a, b, c]
inline void debug_print(std::ostream& os, const std::vector<std::string>& list) {
    os << "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) os << ", ";
        os << list[i];
    }
    os << "]";
}

inline void debug_print(std::ostream& os, const std::set<std::string>& set) {
    os << "{";
    bool first = true;
    for (const auto &s : set) {
        if (!first) os << ", ";
        os << s;
        first = false;
    }
    os << "}";
}

// Base case for recursive printing
inline void _debug_print_helper(std::ostream&) {}

// Recursive variadic template
template<typename T, typename... Args>
void _debug_print_helper(std::ostream& os, T&& first, Args&&... rest) {
    debug_print(os, std::forward<T>(first));
    if constexpr (sizeof...(rest) > 0) {
        _debug_print_helper(os, std::forward<Args>(rest)...);
    }
}

// Debug logging macro
#define DEBUG_LOG(...) do { \
    if (DebugLogger::enabled()) { \
        std::ostringstream debug_oss; \
        debug_oss << "[" << __SHORT_FILE__ << ":" << __LINE__ << "] "; \
        _debug_print_helper(debug_oss, __VA_ARGS__); \
        std::string msg = debug_oss.str(); \
        std::cerr << msg << std::endl; \
        debug_log_file() << msg << std::endl; \
    } \
} while(0)

#else // !SOBERLAUNCHER_DEBUG_LOGGING

// No-op in release
#define DEBUG_LOG(...) do { } while(0)

#endif
