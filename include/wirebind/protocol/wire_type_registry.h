#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <wirebind/core/types.h>
#include <wirebind/protocol/binding.h>
#include <wirebind/protocol/token_stream.h>

namespace wirebind {

// Insertion-ordered so bodies list fields in declaration order
using PayloadDocument = nlohmann::ordered_json;

/**
 * @brief In-memory value of a scalar wire type
 *
 * String -> std::string, Integer -> int32_t, Long -> int64_t, Double -> double,
 * Boolean -> bool, Date -> TimePoint, Blob -> ByteVector.
 */
using Scalar = std::variant<std::string, int32_t, int64_t, double, bool, TimePoint, ByteVector>;

const char* scalarTypeName(const Scalar& value) noexcept;

/**
 * @brief Typed dispatch table from wire type to encoder/decoder pair
 *
 * Each scalar wire type registers one Codec. Textual encoders serve query
 * parameters, headers and path labels; document encoders serve the payload;
 * token decoders serve the response parser. All codecs are pure functions.
 *
 * A registry is filled once and then only read, so one instance can serve any
 * number of concurrent marshall/unmarshall calls.
 */
class WireTypeRegistry {
public:
    struct Codec {
        std::function<Result<std::string>(const Scalar&, const BindingDescriptor&)> toText;
        std::function<Result<Scalar>(std::string_view, const BindingDescriptor&)> fromText;
        std::function<Result<PayloadDocument>(const Scalar&, const BindingDescriptor&)> toDocument;
        std::function<Result<Scalar>(const Token&, const BindingDescriptor&)> fromToken;
    };

    WireTypeRegistry() = default;

    // Registry with codecs for every scalar wire type; built on first use.
    static const WireTypeRegistry& standard();

    void registerCodec(WireType type, Codec codec);
    [[nodiscard]] bool supports(WireType type) const;

    [[nodiscard]] Result<std::string> encodeText(const Scalar& value,
                                                 const BindingDescriptor& binding) const;
    [[nodiscard]] Result<PayloadDocument> encodeDocument(const Scalar& value,
                                                         const BindingDescriptor& binding) const;
    [[nodiscard]] Result<Scalar> decodeText(std::string_view text,
                                            const BindingDescriptor& binding) const;
    [[nodiscard]] Result<Scalar> decodeToken(const Token& token,
                                             const BindingDescriptor& binding) const;

private:
    const Codec* find(WireType type) const;

    std::unordered_map<WireType, Codec> codecs_;
};

} // namespace wirebind
