#include <wirebind/config/config_helpers.h>
#include <wirebind/config/marshalling_config.h>
#include <wirebind/core/logging.h>

#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>

namespace wirebind::config {

namespace {

constexpr const char* kSection = "marshalling";

void readString(const std::filesystem::path& path, const char* key, std::string& out) {
    if (auto v = parse_config_value(path, kSection, key)) {
        out = *v;
    }
}

} // namespace

Result<MarshallingConfig> loadMarshallingConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }

    MarshallingConfig cfg;
    readString(path, "header_list_separator", cfg.headerListSeparator);
    readString(path, "json_content_type", cfg.jsonContentType);
    readString(path, "aws_json_version", cfg.awsJsonVersion);
    readString(path, "query_api_version", cfg.queryApiVersion);
    readString(path, "xml_namespace", cfg.xmlNamespace);
    readString(path, "log_level", cfg.logLevel);

    if (auto raw = parse_config_value(path, kSection, "emit_empty_aws_json_body")) {
        auto flag = parse_bool(*raw);
        if (!flag) {
            return Error{ErrorCode::InvalidArgument,
                         "emit_empty_aws_json_body must be a boolean, got '" + *raw + "'"};
        }
        cfg.emitEmptyAwsJsonBody = *flag;
    }

    if (cfg.headerListSeparator.empty()) {
        return Error{ErrorCode::InvalidArgument, "header_list_separator must not be empty"};
    }
    if (cfg.awsJsonVersion.empty()) {
        return Error{ErrorCode::InvalidArgument, "aws_json_version must not be empty"};
    }

    spdlog::debug("Loaded marshalling config from {}", path.string());
    return cfg;
}

Result<MarshallingConfig> resolveMarshallingConfig(const std::string& override_path) {
    auto path = get_config_path(override_path);

    MarshallingConfig cfg;
    auto loaded = loadMarshallingConfig(path);
    if (loaded) {
        cfg = std::move(loaded).value();
    } else if (loaded.error().code != ErrorCode::NotFound) {
        return loaded.error();
    } else {
        spdlog::debug("No marshalling config at {}, using defaults", path.string());
    }

    if (const char* envLvl = std::getenv("WIREBIND_LOG_LEVEL"); envLvl && *envLvl) {
        cfg.logLevel = envLvl;
    }
    if (!cfg.logLevel.empty()) {
        logging::configure(cfg.logLevel);
    }
    return cfg;
}

} // namespace wirebind::config
