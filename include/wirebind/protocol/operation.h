#pragma once

#include <cstdint>
#include <string>
#include <wirebind/core/types.h>

namespace wirebind {

/**
 * @brief Outer envelope rules applied by the request marshaller
 */
enum class Protocol : uint8_t {
    RestJson = 0, ///< path/query/header mix plus a JSON body
    RestXml,      ///< path/query/header mix plus an XML body
    AwsJson,      ///< single JSON body, operation named by X-Amz-Target
    Query,        ///< form-encoded body with Action/Version
};

enum class HttpMethod : uint8_t { Get = 0, Post, Put, Delete, Patch, Head };

const char* toString(Protocol protocol) noexcept;
const char* toString(HttpMethod method) noexcept;

/**
 * @brief Static description of one API operation
 *
 * One instance per operation, built at start-up and shared read-only.
 */
struct OperationDescriptor {
    Protocol protocol = Protocol::RestJson;
    std::string requestUri = "/"; ///< template with `{name}` / `{name+}` placeholders
    HttpMethod method = HttpMethod::Post;
    std::string operationIdentifier; ///< AwsJson target, e.g. "Service_20130415.Operation"
    std::string operationName;       ///< Query `Action`, default XML root prefix
    std::string payloadRootName; ///< RestXml root element; "<operationName>Request" if empty
    bool hasExplicitPayloadMember = false;
    bool hasPayloadMembers = false;

    Result<void> validate() const;
};

} // namespace wirebind
