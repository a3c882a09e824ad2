#include <wirebind/protocol/encoding.h>
#include <wirebind/protocol/wire_type_registry.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <spdlog/spdlog.h>

namespace wirebind {

const char* scalarTypeName(const Scalar& value) noexcept {
    switch (value.index()) {
        case 0:
            return "string";
        case 1:
            return "int32";
        case 2:
            return "int64";
        case 3:
            return "double";
        case 4:
            return "bool";
        case 5:
            return "timestamp";
        case 6:
            return "blob";
        default:
            return "unknown";
    }
}

namespace {

template <typename T> Result<T> expectScalar(const Scalar& value, const BindingDescriptor& binding) {
    if (const auto* v = std::get_if<T>(&value)) {
        return *v;
    }
    return Error{ErrorCode::EncodeError, std::string("Type mismatch: ") + toString(binding.type()) +
                                             " binding cannot encode a " +
                                             scalarTypeName(value) + " value"};
}

Error unexpectedToken(const Token& token, const BindingDescriptor& binding) {
    return Error{ErrorCode::DecodeError, std::string("Unexpected ") + toString(token.type) +
                                             " token for " + toString(binding.type()) +
                                             " value"};
}

template <typename Int> Result<Int> parseInteger(std::string_view text, const char* what) {
    Int v{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (text.empty() || ptr != text.data() + text.size()) {
        return Error{ErrorCode::DecodeError,
                     "Non-numeric " + std::string(what) + " text '" + std::string(text) + "'"};
    }
    if (ec == std::errc::result_out_of_range) {
        return Error{ErrorCode::DecodeError,
                     std::string(what) + " out of range: '" + std::string(text) + "'"};
    }
    if (ec != std::errc{}) {
        return Error{ErrorCode::DecodeError,
                     "Non-numeric " + std::string(what) + " text '" + std::string(text) + "'"};
    }
    return v;
}

Result<double> parseDouble(std::string_view text) {
    double v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::DecodeError, "Non-numeric double text '" + std::string(text) + "'"};
    }
    return v;
}

Result<bool> parseBoolean(std::string_view text) {
    if (text == "true")
        return true;
    if (text == "false")
        return false;
    return Error{ErrorCode::DecodeError, "Non-canonical boolean '" + std::string(text) + "'"};
}

// Lifts Result<T> into Result<Scalar>
template <typename T> Result<Scalar> asScalar(Result<T> r) {
    if (!r) {
        return r.error();
    }
    return Scalar{std::move(r).value()};
}

WireTypeRegistry::Codec stringCodec() {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) {
        return expectScalar<std::string>(v, b);
    };
    c.fromText = [](std::string_view text, const BindingDescriptor&) -> Result<Scalar> {
        return Scalar{std::string(text)};
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto s = expectScalar<std::string>(v, b);
        if (!s)
            return s.error();
        return PayloadDocument(s.value());
    };
    c.fromToken = [](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        if (t.type != TokenType::String)
            return unexpectedToken(t, b);
        return Scalar{t.text};
    };
    return c;
}

template <typename Int> WireTypeRegistry::Codec integralCodec(const char* what) {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) -> Result<std::string> {
        auto i = expectScalar<Int>(v, b);
        if (!i)
            return i.error();
        return std::to_string(i.value());
    };
    c.fromText = [what](std::string_view text, const BindingDescriptor&) {
        return asScalar(parseInteger<Int>(text, what));
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto i = expectScalar<Int>(v, b);
        if (!i)
            return i.error();
        return PayloadDocument(i.value());
    };
    c.fromToken = [what](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        if (t.type != TokenType::Integer)
            return unexpectedToken(t, b);
        return asScalar(parseInteger<Int>(t.text, what));
    };
    return c;
}

WireTypeRegistry::Codec doubleCodec() {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) -> Result<std::string> {
        auto d = expectScalar<double>(v, b);
        if (!d)
            return d.error();
        return encoding::formatDouble(d.value());
    };
    c.fromText = [](std::string_view text, const BindingDescriptor&) {
        return asScalar(parseDouble(text));
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto d = expectScalar<double>(v, b);
        if (!d)
            return d.error();
        if (!std::isfinite(d.value())) {
            return Error{ErrorCode::EncodeError, "Non-finite double cannot be encoded"};
        }
        return PayloadDocument(d.value());
    };
    c.fromToken = [](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        if (t.type != TokenType::Integer && t.type != TokenType::Float)
            return unexpectedToken(t, b);
        return asScalar(parseDouble(t.text));
    };
    return c;
}

WireTypeRegistry::Codec booleanCodec() {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) -> Result<std::string> {
        auto flag = expectScalar<bool>(v, b);
        if (!flag)
            return flag.error();
        return std::string(flag.value() ? "true" : "false");
    };
    c.fromText = [](std::string_view text, const BindingDescriptor&) {
        return asScalar(parseBoolean(text));
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto flag = expectScalar<bool>(v, b);
        if (!flag)
            return flag.error();
        return PayloadDocument(flag.value());
    };
    c.fromToken = [](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        if (t.type != TokenType::Boolean)
            return unexpectedToken(t, b);
        return asScalar(parseBoolean(t.text));
    };
    return c;
}

WireTypeRegistry::Codec dateCodec() {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) -> Result<std::string> {
        auto tp = expectScalar<TimePoint>(v, b);
        if (!tp)
            return tp.error();
        return encoding::formatTimestamp(tp.value(), b.timestampFormat());
    };
    c.fromText = [](std::string_view text, const BindingDescriptor& b) {
        return asScalar(encoding::parseTimestamp(text, b.timestampFormat()));
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto tp = expectScalar<TimePoint>(v, b);
        if (!tp)
            return tp.error();
        auto millis = std::chrono::floor<std::chrono::milliseconds>(tp.value())
                          .time_since_epoch()
                          .count();
        switch (b.timestampFormat()) {
            case TimestampFormat::UnixMillis:
                return PayloadDocument(millis);
            case TimestampFormat::UnixSeconds:
                if (millis % 1000 == 0)
                    return PayloadDocument(millis / 1000);
                return PayloadDocument(static_cast<double>(millis) / 1000.0);
            default: {
                auto text = encoding::formatTimestamp(tp.value(), b.timestampFormat());
                if (!text)
                    return text.error();
                return PayloadDocument(text.value());
            }
        }
    };
    c.fromToken = [](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        bool numeric = b.timestampFormat() == TimestampFormat::UnixSeconds ||
                       b.timestampFormat() == TimestampFormat::UnixMillis;
        bool ok = numeric ? (t.type == TokenType::Integer ||
                             (t.type == TokenType::Float &&
                              b.timestampFormat() == TimestampFormat::UnixSeconds))
                          : t.type == TokenType::String;
        if (!ok)
            return unexpectedToken(t, b);
        return asScalar(encoding::parseTimestamp(t.text, b.timestampFormat()));
    };
    return c;
}

WireTypeRegistry::Codec blobCodec() {
    WireTypeRegistry::Codec c;
    c.toText = [](const Scalar& v, const BindingDescriptor& b) -> Result<std::string> {
        auto bytes = expectScalar<ByteVector>(v, b);
        if (!bytes)
            return bytes.error();
        return encoding::base64Encode(bytes.value());
    };
    c.fromText = [](std::string_view text, const BindingDescriptor&) {
        return asScalar(encoding::base64Decode(text));
    };
    c.toDocument = [](const Scalar& v, const BindingDescriptor& b) -> Result<PayloadDocument> {
        auto bytes = expectScalar<ByteVector>(v, b);
        if (!bytes)
            return bytes.error();
        return PayloadDocument(encoding::base64Encode(bytes.value()));
    };
    c.fromToken = [](const Token& t, const BindingDescriptor& b) -> Result<Scalar> {
        if (t.type != TokenType::String)
            return unexpectedToken(t, b);
        return asScalar(encoding::base64Decode(t.text));
    };
    return c;
}

} // namespace

//-----------------------------------------------------------------------------
// WireTypeRegistry
//-----------------------------------------------------------------------------

const WireTypeRegistry& WireTypeRegistry::standard() {
    static const WireTypeRegistry registry = [] {
        WireTypeRegistry r;
        r.registerCodec(WireType::String, stringCodec());
        r.registerCodec(WireType::Integer, integralCodec<int32_t>("integer"));
        r.registerCodec(WireType::Long, integralCodec<int64_t>("long"));
        r.registerCodec(WireType::Double, doubleCodec());
        r.registerCodec(WireType::Boolean, booleanCodec());
        r.registerCodec(WireType::Date, dateCodec());
        r.registerCodec(WireType::Blob, blobCodec());
        return r;
    }();
    return registry;
}

void WireTypeRegistry::registerCodec(WireType type, Codec codec) {
    if (codecs_.count(type) > 0) {
        spdlog::warn("Overwriting existing codec for wire type: {}", toString(type));
    }
    codecs_[type] = std::move(codec);
    spdlog::debug("Registered codec for wire type: {}", toString(type));
}

bool WireTypeRegistry::supports(WireType type) const {
    return codecs_.count(type) > 0;
}

const WireTypeRegistry::Codec* WireTypeRegistry::find(WireType type) const {
    auto it = codecs_.find(type);
    return it == codecs_.end() ? nullptr : &it->second;
}

Result<std::string> WireTypeRegistry::encodeText(const Scalar& value,
                                                 const BindingDescriptor& binding) const {
    const auto* codec = find(binding.type());
    if (!codec || !codec->toText) {
        return Error{ErrorCode::EncodeError, std::string("No text encoding for wire type ") +
                                                 toString(binding.type())};
    }
    return codec->toText(value, binding);
}

Result<PayloadDocument> WireTypeRegistry::encodeDocument(const Scalar& value,
                                                         const BindingDescriptor& binding) const {
    const auto* codec = find(binding.type());
    if (!codec || !codec->toDocument) {
        return Error{ErrorCode::EncodeError, std::string("No payload encoding for wire type ") +
                                                 toString(binding.type())};
    }
    return codec->toDocument(value, binding);
}

Result<Scalar> WireTypeRegistry::decodeText(std::string_view text,
                                            const BindingDescriptor& binding) const {
    const auto* codec = find(binding.type());
    if (!codec || !codec->fromText) {
        return Error{ErrorCode::DecodeError, std::string("No text decoding for wire type ") +
                                                 toString(binding.type())};
    }
    return codec->fromText(text, binding);
}

Result<Scalar> WireTypeRegistry::decodeToken(const Token& token,
                                             const BindingDescriptor& binding) const {
    const auto* codec = find(binding.type());
    if (!codec || !codec->fromToken) {
        return Error{ErrorCode::DecodeError, std::string("No token decoding for wire type ") +
                                                 toString(binding.type())};
    }
    return codec->fromToken(token, binding);
}

} // namespace wirebind
