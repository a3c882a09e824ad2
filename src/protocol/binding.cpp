#include <wirebind/protocol/binding.h>

namespace wirebind {

const char* toString(WireLocation location) noexcept {
    switch (location) {
        case WireLocation::Payload:
            return "Payload";
        case WireLocation::QueryParam:
            return "QueryParam";
        case WireLocation::Header:
            return "Header";
        case WireLocation::PathParam:
            return "PathParam";
        case WireLocation::StatusCode:
            return "StatusCode";
    }
    return "Unknown";
}

const char* toString(WireType type) noexcept {
    switch (type) {
        case WireType::String:
            return "String";
        case WireType::Integer:
            return "Integer";
        case WireType::Long:
            return "Long";
        case WireType::Double:
            return "Double";
        case WireType::Boolean:
            return "Boolean";
        case WireType::Date:
            return "Date";
        case WireType::Blob:
            return "Blob";
        case WireType::List:
            return "List";
        case WireType::Map:
            return "Map";
        case WireType::Structured:
            return "Structured";
    }
    return "Unknown";
}

const char* toString(TimestampFormat format) noexcept {
    switch (format) {
        case TimestampFormat::None:
            return "None";
        case TimestampFormat::Iso8601:
            return "Iso8601";
        case TimestampFormat::UnixSeconds:
            return "UnixSeconds";
        case TimestampFormat::UnixMillis:
            return "UnixMillis";
        case TimestampFormat::Rfc822:
            return "Rfc822";
    }
    return "Unknown";
}

//-----------------------------------------------------------------------------
// Factories
//-----------------------------------------------------------------------------

BindingDescriptor BindingDescriptor::scalar(WireLocation location, std::string name,
                                            WireType type) {
    return BindingDescriptor(location, std::move(name), type);
}

BindingDescriptor BindingDescriptor::date(WireLocation location, std::string name,
                                          TimestampFormat format) {
    BindingDescriptor d(location, std::move(name), WireType::Date);
    d.timestampFormat_ = format;
    return d;
}

BindingDescriptor BindingDescriptor::list(WireLocation location, std::string name,
                                          BindingDescriptor element) {
    BindingDescriptor d(location, std::move(name), WireType::List);
    d.member_ = std::make_shared<const BindingDescriptor>(std::move(element));
    return d;
}

BindingDescriptor BindingDescriptor::map(WireLocation location, std::string name,
                                         BindingDescriptor value) {
    BindingDescriptor d(location, std::move(name), WireType::Map);
    d.member_ = std::make_shared<const BindingDescriptor>(std::move(value));
    return d;
}

BindingDescriptor BindingDescriptor::structured(std::string name) {
    return BindingDescriptor(WireLocation::Payload, std::move(name), WireType::Structured);
}

BindingDescriptor BindingDescriptor::element(WireType type) {
    return BindingDescriptor(WireLocation::Payload, "", type);
}

BindingDescriptor BindingDescriptor::element(TimestampFormat format) {
    return date(WireLocation::Payload, "", format);
}

BindingDescriptor BindingDescriptor::listOf(BindingDescriptor element) {
    return list(WireLocation::Payload, "", std::move(element));
}

BindingDescriptor BindingDescriptor::mapOf(BindingDescriptor value) {
    return map(WireLocation::Payload, "", std::move(value));
}

BindingDescriptor BindingDescriptor::withDefault(DefaultSupplier supplier) const {
    BindingDescriptor d = *this;
    d.defaultSupplier_ = std::move(supplier);
    return d;
}

BindingDescriptor BindingDescriptor::asExplicitPayload() const {
    BindingDescriptor d = *this;
    d.explicitPayload_ = true;
    return d;
}

//-----------------------------------------------------------------------------
// Validation
//-----------------------------------------------------------------------------

Result<void> BindingDescriptor::validate() const {
    if (type_ == WireType::Date && timestampFormat_ == TimestampFormat::None) {
        return Error{ErrorCode::InvalidArgument,
                     "Date binding '" + name_ + "' has no timestamp format"};
    }
    if (isCollection()) {
        if (!member_) {
            return Error{ErrorCode::InvalidArgument, std::string(toString(type_)) + " binding '" +
                                                         name_ + "' has no member binding"};
        }
        if (auto r = member_->validate(); !r) {
            return r;
        }
    }
    if (type_ == WireType::Structured && location_ != WireLocation::Payload) {
        return Error{ErrorCode::InvalidArgument, "Structured binding '" + name_ +
                                                     "' must live in the payload, not " +
                                                     toString(location_)};
    }
    if (location_ == WireLocation::PathParam && !isScalar()) {
        return Error{ErrorCode::InvalidArgument,
                     "Path parameter '" + name_ + "' must be a scalar"};
    }
    if (location_ == WireLocation::StatusCode && type_ != WireType::Integer) {
        return Error{ErrorCode::InvalidArgument,
                     "Status code binding '" + name_ + "' must be an Integer"};
    }
    if (hasDefault() && type_ != WireType::String) {
        return Error{ErrorCode::InvalidArgument,
                     "Default supplier on '" + name_ + "' requires a String binding"};
    }
    return {};
}

} // namespace wirebind
