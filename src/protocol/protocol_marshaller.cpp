#include <wirebind/protocol/encoding.h>
#include <wirebind/protocol/protocol_marshaller.h>

#include <spdlog/spdlog.h>

namespace wirebind {

namespace {

constexpr const char* kContentType = "Content-Type";
constexpr const char* kContentLength = "Content-Length";
constexpr const char* kAmzTarget = "X-Amz-Target";
constexpr const char* kFormContentType = "application/x-www-form-urlencoded; charset=utf-8";
constexpr const char* kXmlContentType = "application/xml";
constexpr const char* kOctetStream = "application/octet-stream";

bool usesWrappedCollections(Protocol protocol) {
    return protocol == Protocol::Query || protocol == Protocol::RestXml;
}

std::string scalarNodeText(const PayloadDocument& node) {
    if (node.is_string()) {
        return node.get<std::string>();
    }
    return node.dump();
}

// Flattens a payload tree into Query form fields: Parent.Child, Name.member.N,
// Name.entry.N.key / Name.entry.N.value (1-based).
void flattenQuery(const std::string& prefix, const PayloadDocument& node,
                  std::vector<std::pair<std::string, std::string>>& out) {
    if (node.is_null()) {
        return;
    }
    if (node.is_object()) {
        for (const auto& [key, child] : node.items()) {
            flattenQuery(prefix.empty() ? key : prefix + "." + key, child, out);
        }
        return;
    }
    if (node.is_array()) {
        if (node.empty()) {
            // An explicitly empty collection is sent as "Name="
            auto dot = prefix.rfind('.');
            std::string owner = prefix;
            if (dot != std::string::npos) {
                auto last = prefix.substr(dot + 1);
                if (last == "member" || last == "entry") {
                    owner = prefix.substr(0, dot);
                }
            }
            out.emplace_back(std::move(owner), std::string{});
            return;
        }
        size_t index = 1;
        for (const auto& child : node) {
            flattenQuery(prefix + "." + std::to_string(index++), child, out);
        }
        return;
    }
    out.emplace_back(prefix, scalarNodeText(node));
}

void appendXmlEscaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
        }
    }
}

void renderXmlChildren(const PayloadDocument& node, std::string& out);

void renderXmlElement(const std::string& name, const PayloadDocument& node, std::string& out) {
    if (node.is_null()) {
        return;
    }
    if (node.is_array()) {
        // Repeated elements share the name of their wrapper key (member / entry)
        for (const auto& child : node) {
            renderXmlElement(name, child, out);
        }
        return;
    }
    out += '<';
    out += name;
    out += '>';
    if (node.is_object()) {
        renderXmlChildren(node, out);
    } else {
        appendXmlEscaped(out, scalarNodeText(node));
    }
    out += "</";
    out += name;
    out += '>';
}

void renderXmlChildren(const PayloadDocument& node, std::string& out) {
    for (const auto& [key, child] : node.items()) {
        renderXmlElement(key, child, out);
    }
}

std::string renderXmlDocument(const std::string& rootName, const std::string& xmlns,
                              const PayloadDocument& node) {
    std::string out;
    out += '<';
    out += rootName;
    if (!xmlns.empty()) {
        out += " xmlns=\"";
        appendXmlEscaped(out, xmlns);
        out += '"';
    }
    out += '>';
    if (node.is_object()) {
        renderXmlChildren(node, out);
    } else {
        appendXmlEscaped(out, scalarNodeText(node));
    }
    out += "</";
    out += rootName;
    out += '>';
    return out;
}

} // namespace

ProtocolMarshaller::ProtocolMarshaller(const OperationDescriptor& operation,
                                       config::MarshallingConfig config,
                                       const WireTypeRegistry& registry)
    : operation_(operation), config_(std::move(config)), registry_(registry) {}

Result<void> ProtocolMarshaller::startMarshalling() {
    if (auto ok = operation_.validate(); !ok) {
        return ok;
    }
    builder_.emplace(operation_.method, operation_.requestUri);
    frames_.clear();
    frames_.push_back(PayloadDocument::object());
    explicitDocument_.reset();
    explicitName_.clear();
    rawBody_.reset();
    rawBodyIsBlob_ = false;
    payloadFields_ = 0;
    spdlog::trace("Marshalling {} {} ({})", toString(operation_.method), operation_.requestUri,
                  toString(operation_.protocol));
    return {};
}

Result<void> ProtocolMarshaller::checkBinding(const BindingDescriptor& binding) const {
    if (!builder_) {
        return Error{ErrorCode::InvalidState, "startMarshalling() has not been called"};
    }
    if (auto ok = binding.validate(); !ok) {
        return ok;
    }
    if (depth() > 0 && binding.location() != WireLocation::Payload) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Nested structures only carry payload members, not ") +
                         toString(binding.location())};
    }
    if (binding.isExplicitPayload() && depth() == 0 && !operation_.hasExplicitPayloadMember) {
        return Error{ErrorCode::InvalidArgument,
                     "Operation '" + operation_.operationName + "' has no explicit payload member"};
    }
    return {};
}

Error ProtocolMarshaller::typeMismatch(const BindingDescriptor& binding,
                                       const char* valueKind) const {
    return Error{ErrorCode::EncodeError, std::string("Type mismatch: ") +
                                             toString(binding.type()) +
                                             " binding cannot encode a " + valueKind + " value"};
}

Result<void> ProtocolMarshaller::writeScalar(const Scalar& value, const BindingDescriptor& binding) {
    spdlog::trace("Field '{}' -> {}", binding.name(), toString(binding.location()));

    switch (binding.location()) {
        case WireLocation::Payload: {
            auto node = scalarDocument(value, binding);
            if (!node) {
                return node.error();
            }
            return writePayloadNode(binding, std::move(node).value());
        }
        case WireLocation::QueryParam: {
            auto text = registry_.encodeText(value, binding);
            if (!text) {
                return text.error();
            }
            builder_->addQueryParam(binding.name(), std::move(text).value());
            return {};
        }
        case WireLocation::Header: {
            auto text = registry_.encodeText(value, binding);
            if (!text) {
                return text.error();
            }
            builder_->setHeader(binding.name(), std::move(text).value());
            return {};
        }
        case WireLocation::PathParam: {
            auto text = registry_.encodeText(value, binding);
            if (!text) {
                return text.error();
            }
            return builder_->substitutePathParam(binding.name(), text.value());
        }
        case WireLocation::StatusCode:
            // Response-only location
            spdlog::trace("Field '{}' is bound to the status code, not sent", binding.name());
            return {};
    }
    return Error{ErrorCode::InternalError, "Unhandled wire location"};
}

Result<void> ProtocolMarshaller::writeExplicitPayload(const Scalar& value,
                                                      const BindingDescriptor& binding) {
    switch (binding.type()) {
        case WireType::Blob:
            if (const auto* bytes = std::get_if<ByteVector>(&value)) {
                rawBody_ = encoding::toString(*bytes);
                rawBodyIsBlob_ = true;
                return {};
            }
            return typeMismatch(binding, scalarTypeName(value));
        case WireType::String:
            if (const auto* text = std::get_if<std::string>(&value)) {
                rawBody_ = *text;
                rawBodyIsBlob_ = false;
                return {};
            }
            return typeMismatch(binding, scalarTypeName(value));
        default:
            return Error{ErrorCode::EncodeError,
                         std::string("Explicit payload cannot be a ") + toString(binding.type()) +
                             " value"};
    }
}

Result<void> ProtocolMarshaller::writePayloadNode(const BindingDescriptor& binding,
                                                  PayloadDocument node) {
    if (depth() == 0) {
        if (operation_.hasExplicitPayloadMember) {
            return Error{ErrorCode::InvalidArgument,
                         "Body is reserved for the explicit payload member"};
        }
        ++payloadFields_;
    }
    frames_.back()[binding.name()] = std::move(node);
    return {};
}

Result<void> ProtocolMarshaller::writeListText(const std::vector<std::string>& values,
                                               const BindingDescriptor& binding) {
    switch (binding.location()) {
        case WireLocation::QueryParam:
            for (const auto& v : values) {
                builder_->addQueryParam(binding.name(), v);
            }
            return {};
        case WireLocation::Header: {
            if (values.empty()) {
                return {};
            }
            std::string joined;
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) {
                    joined += config_.headerListSeparator;
                }
                joined += values[i];
            }
            builder_->setHeader(binding.name(), std::move(joined));
            return {};
        }
        default:
            return Error{ErrorCode::EncodeError, std::string("List cannot be bound to ") +
                                                     toString(binding.location())};
    }
}

Result<void>
ProtocolMarshaller::writeMapText(const std::vector<std::pair<std::string, std::string>>& entries,
                                 const BindingDescriptor& binding) {
    switch (binding.location()) {
        case WireLocation::QueryParam:
            for (const auto& [key, v] : entries) {
                builder_->addQueryParam(key, v);
            }
            return {};
        case WireLocation::Header:
            for (const auto& [key, v] : entries) {
                builder_->setHeader(binding.name() + key, v);
            }
            return {};
        default:
            return Error{ErrorCode::EncodeError, std::string("Map cannot be bound to ") +
                                                     toString(binding.location())};
    }
}

Result<PayloadDocument> ProtocolMarshaller::scalarDocument(const Scalar& value,
                                                           const BindingDescriptor& binding) {
    // Form fields and XML text carry the textual encoding
    if (usesWrappedCollections(operation_.protocol)) {
        auto text = registry_.encodeText(value, binding);
        if (!text) {
            return text.error();
        }
        return PayloadDocument(std::move(text).value());
    }
    return registry_.encodeDocument(value, binding);
}

PayloadDocument ProtocolMarshaller::wrapList(PayloadDocument array) const {
    if (!usesWrappedCollections(operation_.protocol)) {
        return array;
    }
    PayloadDocument wrapped = PayloadDocument::object();
    wrapped["member"] = std::move(array);
    return wrapped;
}

PayloadDocument
ProtocolMarshaller::wrapMap(std::vector<std::pair<std::string, PayloadDocument>> entries) const {
    if (!usesWrappedCollections(operation_.protocol)) {
        PayloadDocument object = PayloadDocument::object();
        for (auto& [key, node] : entries) {
            object[key] = std::move(node);
        }
        return object;
    }
    PayloadDocument list = PayloadDocument::array();
    for (auto& [key, node] : entries) {
        PayloadDocument entry = PayloadDocument::object();
        entry["key"] = key;
        entry["value"] = std::move(node);
        list.push_back(std::move(entry));
    }
    PayloadDocument wrapped = PayloadDocument::object();
    wrapped["entry"] = std::move(list);
    return wrapped;
}

//-----------------------------------------------------------------------------
// Envelope
//-----------------------------------------------------------------------------

Result<void> ProtocolMarshaller::renderBody() {
    auto setContentType = [this](const std::string& type) {
        if (!builder_->hasHeader(kContentType)) {
            builder_->setHeader(kContentType, type);
        }
    };

    if (operation_.hasExplicitPayloadMember) {
        if (rawBody_) {
            builder_->setBody(std::move(*rawBody_));
            if (rawBodyIsBlob_) {
                setContentType(kOctetStream);
            }
        } else if (explicitDocument_) {
            if (operation_.protocol == Protocol::RestXml) {
                builder_->setBody(
                    renderXmlDocument(explicitName_, config_.xmlNamespace, *explicitDocument_));
                setContentType(kXmlContentType);
            } else {
                builder_->setBody(explicitDocument_->dump());
                setContentType(operation_.protocol == Protocol::AwsJson
                                   ? config_.awsJsonContentType()
                                   : config_.jsonContentType);
            }
        }
        return {};
    }

    const PayloadDocument& root = frames_.front();
    switch (operation_.protocol) {
        case Protocol::RestJson:
            if (operation_.hasPayloadMembers) {
                builder_->setBody(root.dump());
                setContentType(config_.jsonContentType);
            }
            return {};
        case Protocol::AwsJson:
            if (!builder_->hasHeader(kAmzTarget)) {
                builder_->setHeader(kAmzTarget, operation_.operationIdentifier);
            }
            if (!root.empty() || config_.emitEmptyAwsJsonBody) {
                builder_->setBody(root.dump());
            }
            setContentType(config_.awsJsonContentType());
            return {};
        case Protocol::Query: {
            std::vector<std::pair<std::string, std::string>> fields;
            fields.emplace_back("Action", operation_.operationName);
            if (!config_.queryApiVersion.empty()) {
                fields.emplace_back("Version", config_.queryApiVersion);
            }
            flattenQuery("", root, fields);

            std::string body;
            for (const auto& [key, value] : fields) {
                if (!body.empty()) {
                    body += '&';
                }
                body += encoding::urlEncode(key);
                body += '=';
                body += encoding::urlEncode(value);
            }
            builder_->setBody(std::move(body));
            setContentType(kFormContentType);
            return {};
        }
        case Protocol::RestXml:
            if (operation_.hasPayloadMembers) {
                const std::string rootName = operation_.payloadRootName.empty()
                                                 ? operation_.operationName + "Request"
                                                 : operation_.payloadRootName;
                builder_->setBody(renderXmlDocument(rootName, config_.xmlNamespace, root));
                setContentType(kXmlContentType);
            }
            return {};
    }
    return Error{ErrorCode::InternalError, "Unhandled protocol"};
}

Result<Request> ProtocolMarshaller::finishMarshalling() {
    if (!builder_) {
        return Error{ErrorCode::InvalidState, "startMarshalling() has not been called"};
    }
    if (frames_.size() != 1) {
        return Error{ErrorCode::InvalidState, "finishMarshalling() called inside a nested value"};
    }

    if (auto ok = renderBody(); !ok) {
        builder_.reset();
        return ok.error();
    }

    if (builder_->hasBody()) {
        builder_->setHeader(kContentLength, std::to_string(builder_->body().size()));
    }

    RequestBuilder builder = std::move(*builder_);
    builder_.reset();
    frames_.clear();

    auto built = std::move(builder).build();
    if (!built) {
        Error e{ErrorCode::MarshallError, "Unable to finalize request: " + built.error().message};
        e.cause = std::make_shared<const Error>(built.error());
        return e;
    }

    Request request = std::move(built).value();
    spdlog::debug("Marshalled {} {} with {} payload field(s), {} body byte(s)",
                  toString(request.method()), request.path(), payloadFields_,
                  request.body().size());
    return request;
}

} // namespace wirebind
