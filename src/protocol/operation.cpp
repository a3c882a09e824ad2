#include <wirebind/protocol/operation.h>

namespace wirebind {

const char* toString(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::RestJson:
            return "RestJson";
        case Protocol::RestXml:
            return "RestXml";
        case Protocol::AwsJson:
            return "AwsJson";
        case Protocol::Query:
            return "Query";
    }
    return "Unknown";
}

const char* toString(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Delete:
            return "DELETE";
        case HttpMethod::Patch:
            return "PATCH";
        case HttpMethod::Head:
            return "HEAD";
    }
    return "UNKNOWN";
}

Result<void> OperationDescriptor::validate() const {
    if (requestUri.empty() || requestUri.front() != '/') {
        return Error{ErrorCode::InvalidArgument,
                     "Request URI template must start with '/': '" + requestUri + "'"};
    }
    if (protocol == Protocol::AwsJson && operationIdentifier.empty()) {
        return Error{ErrorCode::InvalidArgument, "AwsJson operation requires an identifier"};
    }
    if (protocol == Protocol::Query && operationName.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query operation requires an operation name"};
    }
    if (protocol == Protocol::RestXml && hasPayloadMembers && !hasExplicitPayloadMember &&
        payloadRootName.empty() && operationName.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "RestXml operation with payload members needs a root element name"};
    }
    return {};
}

} // namespace wirebind
