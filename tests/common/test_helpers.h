// Shared helpers for wirebind unit tests
#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <wirebind/protocol/token_stream.h>

namespace wirebind::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "wirebind_test_") {
    auto base = std::filesystem::temp_directory_path();
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(stamp) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// RAII helper to set/restore environment variables; nullopt unsets
struct EnvGuard {
    std::string name;
    std::optional<std::string> originalValue;

    EnvGuard(const std::string& envName, const std::optional<std::string>& newValue)
        : name(envName) {
        if (const char* orig = std::getenv(name.c_str())) {
            originalValue = orig;
        }
        if (newValue) {
            setenv(name.c_str(), newValue->c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        if (originalValue) {
            setenv(name.c_str(), originalValue->c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
};

// Drains a token source; stops at the first error
inline std::vector<Token> drain(ITokenSource& source) {
    std::vector<Token> out;
    for (;;) {
        auto t = source.next();
        if (!t || !t.value()) {
            break;
        }
        out.push_back(*t.value());
    }
    return out;
}

} // namespace wirebind::tests
