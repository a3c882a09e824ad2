#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wirebind/core/types.h>
#include <wirebind/protocol/operation.h>

namespace wirebind {

// Header names compare case-insensitively
struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Wire-ready request produced by a marshalling pass
 *
 * Immutable once built; query parameters keep their insertion order.
 */
class Request {
public:
    HttpMethod method() const noexcept { return method_; }
    const std::string& path() const noexcept { return path_; }
    const QueryParameters& queryParameters() const noexcept { return query_; }
    const HeaderMap& headers() const noexcept { return headers_; }
    const std::string& body() const noexcept { return body_; }
    bool hasBody() const noexcept { return hasBody_; }

    std::optional<std::string> header(std::string_view name) const;

    // Values of every query parameter called `name`, in order
    std::vector<std::string> queryValues(std::string_view name) const;

    // Path plus percent-encoded query string
    std::string uri() const;

private:
    friend class RequestBuilder;
    Request() = default;

    HttpMethod method_ = HttpMethod::Get;
    std::string path_;
    QueryParameters query_;
    HeaderMap headers_;
    std::string body_;
    bool hasBody_ = false;
};

/**
 * @brief Accumulates the parts of a request during one marshalling pass
 *
 * Owned by exactly one marshaller; build() consumes it.
 */
class RequestBuilder {
public:
    RequestBuilder(HttpMethod method, std::string uriTemplate);

    /**
     * @brief Replace `{name}` (or greedy `{name+}`) in the URI template
     *
     * The value is percent-encoded; greedy labels keep '/' so a key can span
     * several path segments.
     * @return InvalidArgument if no placeholder matches or the value is empty
     */
    Result<void> substitutePathParam(std::string_view name, std::string_view value);

    void addQueryParam(std::string name, std::string value);
    void setHeader(std::string name, std::string value);
    bool hasHeader(std::string_view name) const;
    void setBody(std::string body);
    bool hasBody() const noexcept { return hasBody_; }
    const std::string& body() const noexcept { return body_; }

    const std::string& currentPath() const noexcept { return path_; }

    // Fails when a `{placeholder}` is still unresolved
    Result<Request> build() &&;

private:
    HttpMethod method_;
    std::string path_;
    QueryParameters query_;
    HeaderMap headers_;
    std::string body_;
    bool hasBody_ = false;
};

} // namespace wirebind
