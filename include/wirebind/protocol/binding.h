#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <wirebind/core/types.h>

namespace wirebind {

/**
 * @brief Where a field's encoded value lives on a request or response
 */
enum class WireLocation : uint8_t {
    Payload = 0, ///< Body document (JSON key, XML element, form field)
    QueryParam,  ///< Query string parameter
    Header,      ///< HTTP header
    PathParam,   ///< `{name}` placeholder in the request URI
    StatusCode,  ///< HTTP status code (response side only)
};

/**
 * @brief Encoding of a field's value on the wire
 */
enum class WireType : uint8_t {
    String = 0,
    Integer, ///< 32-bit signed
    Long,    ///< 64-bit signed
    Double,
    Boolean,
    Date, ///< Requires an explicit TimestampFormat
    Blob, ///< base64 text on textual wires
    List,
    Map,
    Structured,
};

/**
 * @brief Timestamp representation; never inferred, always set per binding
 */
enum class TimestampFormat : uint8_t {
    None = 0,
    Iso8601,     ///< 2020-01-01T00:00:00Z
    UnixSeconds, ///< 1577836800 or 1577836800.5
    UnixMillis,  ///< 1577836800000
    Rfc822,      ///< Wed, 01 Jan 2020 00:00:00 GMT
};

const char* toString(WireLocation location) noexcept;
const char* toString(WireType type) noexcept;
const char* toString(TimestampFormat format) noexcept;

/**
 * @brief Immutable description of one field's wire binding
 *
 * Descriptors are built once per field (usually inside a shape's static binding
 * table) and shared read-only by every marshall/unmarshall call. List and Map
 * descriptors own the binding of their element/value through a shared pointer,
 * so copies stay cheap and never alias mutable state.
 */
class BindingDescriptor {
public:
    using DefaultSupplier = std::function<std::string()>;

    static BindingDescriptor scalar(WireLocation location, std::string name, WireType type);
    static BindingDescriptor date(WireLocation location, std::string name,
                                  TimestampFormat format);
    static BindingDescriptor list(WireLocation location, std::string name,
                                  BindingDescriptor element);
    static BindingDescriptor map(WireLocation location, std::string name, BindingDescriptor value);
    static BindingDescriptor structured(std::string name);

    // Shorthands for the common payload case
    static BindingDescriptor payload(std::string name, WireType type) {
        return scalar(WireLocation::Payload, std::move(name), type);
    }

    // Unnamed descriptors used for list elements and map values
    static BindingDescriptor element(WireType type);
    static BindingDescriptor element(TimestampFormat format);
    static BindingDescriptor listOf(BindingDescriptor element);
    static BindingDescriptor mapOf(BindingDescriptor value);

    // Value emitted when the caller leaves the field absent (idempotency tokens)
    [[nodiscard]] BindingDescriptor withDefault(DefaultSupplier supplier) const;

    // Marks the payload member whose value is the whole request body
    [[nodiscard]] BindingDescriptor asExplicitPayload() const;

    WireLocation location() const noexcept { return location_; }
    const std::string& name() const noexcept { return name_; }
    WireType type() const noexcept { return type_; }
    TimestampFormat timestampFormat() const noexcept { return timestampFormat_; }

    // Element binding for List, value binding for Map, nullptr otherwise
    const BindingDescriptor* member() const noexcept { return member_.get(); }

    bool hasDefault() const noexcept { return static_cast<bool>(defaultSupplier_); }
    std::string supplyDefault() const { return defaultSupplier_ ? defaultSupplier_() : ""; }
    bool isExplicitPayload() const noexcept { return explicitPayload_; }

    bool isCollection() const noexcept {
        return type_ == WireType::List || type_ == WireType::Map;
    }
    bool isScalar() const noexcept { return !isCollection() && type_ != WireType::Structured; }

    /**
     * @brief Check the structural rules a descriptor must satisfy
     *
     * Date needs a format, collections need a member binding, Structured lives
     * in the payload only, path params and status codes are scalar.
     */
    Result<void> validate() const;

private:
    BindingDescriptor(WireLocation location, std::string name, WireType type)
        : location_(location), name_(std::move(name)), type_(type) {}

    WireLocation location_;
    std::string name_;
    WireType type_;
    TimestampFormat timestampFormat_ = TimestampFormat::None;
    std::shared_ptr<const BindingDescriptor> member_;
    DefaultSupplier defaultSupplier_;
    bool explicitPayload_ = false;
};

} // namespace wirebind
