#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <wirebind/config/marshalling_config.h>
#include <wirebind/core/types.h>
#include <wirebind/protocol/binding.h>
#include <wirebind/protocol/operation.h>
#include <wirebind/protocol/request.h>
#include <wirebind/protocol/structured_value.h>
#include <wirebind/protocol/value_traits.h>
#include <wirebind/protocol/wire_type_registry.h>

namespace wirebind {

/**
 * @brief Request marshalling driver
 *
 * One instance serves one marshalling pass:
 *
 *   ProtocolMarshaller m(operation, config);
 *   m.startMarshalling();
 *   m.marshall(request.maxResults, MAX_RESULTS_BINDING);
 *   ...
 *   auto req = m.finishMarshalling();
 *
 * Each marshall() call dispatches on the binding's wire location. Absent values
 * (empty std::optional) leave no trace on the wire unless the binding carries a
 * default supplier. Failures are wrapped as MarshallError naming the field, and
 * callers abort the pass on the first one.
 *
 * Payload values are assembled into a document that finishMarshalling()
 * renders according to the operation's protocol (JSON, XML or form fields).
 */
class ProtocolMarshaller {
public:
    ProtocolMarshaller(const OperationDescriptor& operation, config::MarshallingConfig config = {},
                       const WireTypeRegistry& registry = WireTypeRegistry::standard());

    ProtocolMarshaller(const ProtocolMarshaller&) = delete;
    ProtocolMarshaller& operator=(const ProtocolMarshaller&) = delete;

    [[nodiscard]] Result<void> startMarshalling();

    template <typename T>
    [[nodiscard]] Result<void> marshall(const T& value, const BindingDescriptor& binding) {
        static_assert(WireValue<T>, "type has no wire representation");
        auto r = dispatch(value, binding);
        if (!r) {
            return Error::wrap(ErrorCode::MarshallError, binding.name(), r.error(),
                               "Unable to marshall field");
        }
        return r;
    }

    [[nodiscard]] Result<Request> finishMarshalling();

    const OperationDescriptor& operation() const noexcept { return operation_; }

    // Nesting level of the structure currently being written (0 = request root)
    size_t depth() const noexcept { return frames_.empty() ? 0 : frames_.size() - 1; }

private:
    template <typename T> Result<void> dispatch(const T& value, const BindingDescriptor& binding) {
        if (auto ok = checkBinding(binding); !ok) {
            return ok;
        }

        if constexpr (OptionalValue<T>) {
            if (!value) {
                if (binding.hasDefault()) {
                    spdlog::trace("Field '{}' absent, emitting supplied default", binding.name());
                    return dispatch(binding.supplyDefault(), binding);
                }
                spdlog::trace("Field '{}' absent, skipped", binding.name());
                return {};
            }
            return dispatch(*value, binding);
        } else if constexpr (ScalarValue<T>) {
            if (binding.isExplicitPayload() && depth() == 0) {
                return writeExplicitPayload(Scalar{value}, binding);
            }
            return writeScalar(Scalar{value}, binding);
        } else if constexpr (ListValue<T> || MapValue<T>) {
            const WireType expected = ListValue<T> ? WireType::List : WireType::Map;
            if (binding.type() != expected) {
                return typeMismatch(binding, toString(expected));
            }
            if (binding.location() == WireLocation::Payload) {
                auto doc = toDocument(value, binding);
                if (!doc) {
                    return doc.error();
                }
                return writePayloadNode(binding, std::move(doc).value());
            }
            if constexpr (ListValue<T>) {
                std::vector<std::string> texts;
                texts.reserve(value.size());
                for (const auto& element : value) {
                    auto text = toText(element, *binding.member());
                    if (!text) {
                        return text.error();
                    }
                    if (text.value()) {
                        texts.push_back(*std::move(text).value());
                    }
                }
                return writeListText(texts, binding);
            } else {
                std::vector<std::pair<std::string, std::string>> entries;
                entries.reserve(value.size());
                for (const auto& [key, element] : value) {
                    auto text = toText(element, *binding.member());
                    if (!text) {
                        return text.error();
                    }
                    if (text.value()) {
                        entries.emplace_back(key, *std::move(text).value());
                    }
                }
                return writeMapText(entries, binding);
            }
        } else if constexpr (StructuredShape<T>) {
            if (binding.type() != WireType::Structured) {
                return typeMismatch(binding, "Structured");
            }
            auto doc = toDocument(value, binding);
            if (!doc) {
                return doc.error();
            }
            if (binding.isExplicitPayload() && depth() == 0) {
                explicitDocument_ = std::move(doc).value();
                explicitName_ = binding.name();
                return {};
            }
            return writePayloadNode(binding, std::move(doc).value());
        } else {
            static_assert(always_false_v<T>, "unsupported wire value type");
        }
    }

    // Builds the payload node for a value, recursing through collections and
    // nested structures. Absent collection elements become null.
    template <typename T>
    Result<PayloadDocument> toDocument(const T& value, const BindingDescriptor& binding) {
        if constexpr (OptionalValue<T>) {
            if (!value) {
                return PayloadDocument(nullptr);
            }
            return toDocument(*value, binding);
        } else if constexpr (ScalarValue<T>) {
            return scalarDocument(Scalar{value}, binding);
        } else if constexpr (ListValue<T>) {
            if (binding.type() != WireType::List || !binding.member()) {
                return typeMismatch(binding, "List");
            }
            PayloadDocument array = PayloadDocument::array();
            size_t index = 0;
            for (const auto& element : value) {
                auto node = toDocument(element, *binding.member());
                if (!node) {
                    return Error::wrap(ErrorCode::EncodeError, "[" + std::to_string(index) + "]",
                                       node.error(), "Invalid list element");
                }
                array.push_back(std::move(node).value());
                ++index;
            }
            return wrapList(std::move(array));
        } else if constexpr (MapValue<T>) {
            if (binding.type() != WireType::Map || !binding.member()) {
                return typeMismatch(binding, "Map");
            }
            std::vector<std::pair<std::string, PayloadDocument>> entries;
            entries.reserve(value.size());
            for (const auto& [key, element] : value) {
                auto node = toDocument(element, *binding.member());
                if (!node) {
                    return Error::wrap(ErrorCode::EncodeError, key, node.error(),
                                       "Invalid map value");
                }
                entries.emplace_back(key, std::move(node).value());
            }
            return wrapMap(std::move(entries));
        } else if constexpr (StructuredShape<T>) {
            if (binding.type() != WireType::Structured) {
                return typeMismatch(binding, "Structured");
            }
            frames_.push_back(PayloadDocument::object());
            auto r = value.marshallSelf(*this);
            PayloadDocument node = std::move(frames_.back());
            frames_.pop_back();
            if (!r) {
                return r.error();
            }
            return node;
        } else {
            static_assert(always_false_v<T>, "unsupported wire value type");
        }
    }

    // Textual form of a collection element bound outside the payload;
    // nullopt for an absent element.
    template <typename T>
    Result<std::optional<std::string>> toText(const T& value, const BindingDescriptor& binding) {
        if constexpr (OptionalValue<T>) {
            if (!value) {
                return std::optional<std::string>{};
            }
            return toText(*value, binding);
        } else if constexpr (ScalarValue<T>) {
            auto text = registry_.encodeText(Scalar{value}, binding);
            if (!text) {
                return text.error();
            }
            return std::optional<std::string>{std::move(text).value()};
        } else {
            return Error{ErrorCode::EncodeError,
                         "Only scalar elements can be written outside the payload"};
        }
    }

    Result<void> checkBinding(const BindingDescriptor& binding) const;
    Error typeMismatch(const BindingDescriptor& binding, const char* valueKind) const;

    Result<void> writeScalar(const Scalar& value, const BindingDescriptor& binding);
    Result<void> writeExplicitPayload(const Scalar& value, const BindingDescriptor& binding);
    Result<void> writePayloadNode(const BindingDescriptor& binding, PayloadDocument node);
    Result<void> writeListText(const std::vector<std::string>& values,
                               const BindingDescriptor& binding);
    Result<void> writeMapText(const std::vector<std::pair<std::string, std::string>>& entries,
                              const BindingDescriptor& binding);

    Result<PayloadDocument> scalarDocument(const Scalar& value, const BindingDescriptor& binding);
    PayloadDocument wrapList(PayloadDocument array) const;
    PayloadDocument wrapMap(std::vector<std::pair<std::string, PayloadDocument>> entries) const;

    Result<void> renderBody();

    const OperationDescriptor& operation_;
    config::MarshallingConfig config_;
    const WireTypeRegistry& registry_;

    std::optional<RequestBuilder> builder_;
    std::vector<PayloadDocument> frames_;
    std::optional<PayloadDocument> explicitDocument_;
    std::string explicitName_;
    std::optional<std::string> rawBody_;
    bool rawBodyIsBlob_ = false;
    size_t payloadFields_ = 0;
};

} // namespace wirebind
