#pragma once

#include <filesystem>
#include <string>
#include <wirebind/core/types.h>

namespace wirebind::config {

/**
 * @brief Engine tunables shared by every marshall call
 *
 * Read once at start-up and passed by const reference; never mutated while
 * marshallers are running.
 */
struct MarshallingConfig {
    std::string headerListSeparator = ",";
    std::string jsonContentType = "application/json";
    std::string awsJsonVersion = "1.1";
    std::string queryApiVersion;
    std::string xmlNamespace;
    bool emitEmptyAwsJsonBody = true;
    std::string logLevel; ///< empty leaves the logger untouched

    std::string awsJsonContentType() const {
        return "application/x-amz-json-" + awsJsonVersion;
    }
};

// Reads the [marshalling] section; keys missing from the file keep their defaults.
Result<MarshallingConfig> loadMarshallingConfig(const std::filesystem::path& path);

// get_config_path() (defaults when the file does not exist), then WIREBIND_LOG_LEVEL.
// A non-empty resolved log level is applied to the default logger.
Result<MarshallingConfig> resolveMarshallingConfig(const std::string& override_path = "");

} // namespace wirebind::config
