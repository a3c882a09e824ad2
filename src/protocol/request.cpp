#include <wirebind/protocol/encoding.h>
#include <wirebind/protocol/request.h>

#include <algorithm>
#include <cctype>

namespace wirebind {

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y) {
                                            return std::tolower(x) < std::tolower(y);
                                        });
}

//-----------------------------------------------------------------------------
// Request
//-----------------------------------------------------------------------------

std::optional<std::string> Request::header(std::string_view name) const {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Request::queryValues(std::string_view name) const {
    std::vector<std::string> values;
    for (const auto& [k, v] : query_) {
        if (k == name) {
            values.push_back(v);
        }
    }
    return values;
}

std::string Request::uri() const {
    std::string out = path_;
    char sep = '?';
    for (const auto& [k, v] : query_) {
        out += sep;
        out += encoding::urlEncode(k);
        out += '=';
        out += encoding::urlEncode(v);
        sep = '&';
    }
    return out;
}

//-----------------------------------------------------------------------------
// RequestBuilder
//-----------------------------------------------------------------------------

RequestBuilder::RequestBuilder(HttpMethod method, std::string uriTemplate)
    : method_(method), path_(std::move(uriTemplate)) {}

Result<void> RequestBuilder::substitutePathParam(std::string_view name, std::string_view value) {
    std::string plain = "{" + std::string(name) + "}";
    std::string greedy = "{" + std::string(name) + "+}";

    bool isGreedy = false;
    auto pos = path_.find(plain);
    if (pos == std::string::npos) {
        pos = path_.find(greedy);
        isGreedy = pos != std::string::npos;
    }
    if (pos == std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "URI template '" + path_ +
                                                     "' has no placeholder for '" +
                                                     std::string(name) + "'"};
    }
    if (value.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Path parameter '" + std::string(name) + "' must not be empty"};
    }

    const auto& token = isGreedy ? greedy : plain;
    std::string_view encodedSource = value;
    // Greedy labels may carry a leading '/' that the template already supplies
    if (isGreedy && !encodedSource.empty() && encodedSource.front() == '/' && pos > 0 &&
        path_[pos - 1] == '/') {
        encodedSource.remove_prefix(1);
    }
    path_.replace(pos, token.size(), encoding::urlEncode(encodedSource, isGreedy));
    return {};
}

void RequestBuilder::addQueryParam(std::string name, std::string value) {
    query_.emplace_back(std::move(name), std::move(value));
}

void RequestBuilder::setHeader(std::string name, std::string value) {
    headers_.insert_or_assign(std::move(name), std::move(value));
}

bool RequestBuilder::hasHeader(std::string_view name) const {
    return headers_.find(name) != headers_.end();
}

void RequestBuilder::setBody(std::string body) {
    body_ = std::move(body);
    hasBody_ = true;
}

Result<Request> RequestBuilder::build() && {
    auto open = path_.find('{');
    if (open != std::string::npos) {
        auto close = path_.find('}', open);
        return Error{ErrorCode::InvalidArgument,
                     "Unresolved path placeholder " + path_.substr(open, close == std::string::npos
                                                                             ? std::string::npos
                                                                             : close - open + 1)};
    }

    Request req;
    req.method_ = method_;
    req.path_ = std::move(path_);
    req.query_ = std::move(query_);
    req.headers_ = std::move(headers_);
    req.body_ = std::move(body_);
    req.hasBody_ = hasBody_;
    return req;
}

} // namespace wirebind
