#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <wirebind/config/marshalling_config.h>
#include <wirebind/core/types.h>
#include <wirebind/protocol/binding.h>
#include <wirebind/protocol/operation.h>
#include <wirebind/protocol/protocol_marshaller.h>
#include <wirebind/protocol/response_unmarshaller.h>
#include <wirebind/protocol/structured_value.h>
#include <wirebind/protocol/value_traits.h>

namespace wirebind {

namespace detail {

inline Error unexpectedValue(const Token& token, const BindingDescriptor& binding) {
    return Error{ErrorCode::ParseError, std::string("Unexpected ") + toString(token.type) +
                                            " token for " + toString(binding.type()) + " value"};
}

inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    CaseInsensitiveLess less;
    return !less(a, b) && !less(b, a);
}

template <typename V> Result<V> scalarAs(Result<Scalar> decoded, const BindingDescriptor& binding) {
    if (!decoded) {
        return decoded.error();
    }
    if (auto* v = std::get_if<V>(&decoded.value())) {
        return std::move(*v);
    }
    return Error{ErrorCode::ParseError, std::string(toString(binding.type())) +
                                            " binding does not match the member type"};
}

// Reads one value whose first token has already been taken from the stream
template <typename V>
Result<void> readValue(V& out, UnmarshallerContext& ctx, const Token& first,
                       const BindingDescriptor& binding);

template <typename V>
Result<void> readStructure(V& out, UnmarshallerContext& ctx, const Token& first,
                           const BindingDescriptor& binding) {
    if (first.type != TokenType::StartObject) {
        return unexpectedValue(first, binding);
    }
    return V::bindings().unmarshallObject(out, ctx);
}

template <typename V>
Result<void> readValue(V& out, UnmarshallerContext& ctx, const Token& first,
                       const BindingDescriptor& binding) {
    if constexpr (OptionalValue<V>) {
        if (first.type == TokenType::Null) {
            out.reset();
            return {};
        }
        typename V::value_type value{};
        if (auto r = readValue(value, ctx, first, binding); !r) {
            return r;
        }
        out = std::move(value);
        return {};
    } else if constexpr (ScalarValue<V>) {
        if (!first.isScalar() || first.type == TokenType::Null) {
            return unexpectedValue(first, binding);
        }
        auto value = scalarAs<V>(ctx.readScalar(first, binding), binding);
        if (!value) {
            return value.error();
        }
        out = std::move(value).value();
        return {};
    } else if constexpr (ListValue<V>) {
        if (first.type != TokenType::StartArray || binding.type() != WireType::List) {
            return unexpectedValue(first, binding);
        }
        V items;
        for (size_t index = 0;; ++index) {
            auto token = ctx.nextToken();
            if (!token) {
                return token.error();
            }
            if (token.value().type == TokenType::EndArray) {
                break;
            }
            typename V::value_type element{};
            if (auto r = readValue(element, ctx, token.value(), *binding.member()); !r) {
                return Error::wrap(ErrorCode::ParseError, "[" + std::to_string(index) + "]",
                                   r.error(), "Invalid list element");
            }
            items.push_back(std::move(element));
        }
        out = std::move(items);
        return {};
    } else if constexpr (MapValue<V>) {
        if (first.type != TokenType::StartObject || binding.type() != WireType::Map) {
            return unexpectedValue(first, binding);
        }
        V entries;
        for (;;) {
            auto key = ctx.nextToken();
            if (!key) {
                return key.error();
            }
            if (key.value().type == TokenType::EndObject) {
                break;
            }
            auto token = ctx.nextToken();
            if (!token) {
                return token.error();
            }
            typename V::mapped_type element{};
            if (auto r = readValue(element, ctx, token.value(), *binding.member()); !r) {
                return Error::wrap(ErrorCode::ParseError, key.value().text, r.error(),
                                   "Invalid map value");
            }
            entries.insert_or_assign(key.value().text, std::move(element));
        }
        out = std::move(entries);
        return {};
    } else if constexpr (StructuredShape<V>) {
        if (binding.type() != WireType::Structured) {
            return unexpectedValue(first, binding);
        }
        return readStructure(out, ctx, first, binding);
    } else {
        static_assert(always_false_v<V>, "unsupported wire value type");
    }
}

template <typename V>
Result<void> readHeader(V& out, std::string_view text, const UnmarshallerContext& ctx,
                        const BindingDescriptor& binding) {
    if constexpr (OptionalValue<V>) {
        typename V::value_type value{};
        if (auto r = readHeader(value, text, ctx, binding); !r) {
            return r;
        }
        out = std::move(value);
        return {};
    } else if constexpr (ScalarValue<V>) {
        auto value = scalarAs<V>(ctx.readText(text, binding), binding);
        if (!value) {
            return value.error();
        }
        out = std::move(value).value();
        return {};
    } else if constexpr (ListValue<V>) {
        // Comma-separated; surrounding blanks are not part of a value
        V items;
        size_t start = 0;
        while (start <= text.size()) {
            auto comma = text.find(',', start);
            auto piece = text.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                            : comma - start);
            while (!piece.empty() && piece.front() == ' ')
                piece.remove_prefix(1);
            while (!piece.empty() && piece.back() == ' ')
                piece.remove_suffix(1);
            if (!piece.empty()) {
                typename V::value_type element{};
                if (auto r = readHeader(element, piece, ctx, *binding.member()); !r) {
                    return r;
                }
                items.push_back(std::move(element));
            }
            if (comma == std::string_view::npos) {
                break;
            }
            start = comma + 1;
        }
        out = std::move(items);
        return {};
    } else {
        return Error{ErrorCode::ParseError,
                     std::string(toString(binding.type())) + " value cannot be read from a header"};
    }
}

template <typename V>
concept HeaderPrefixMap = MapValue<V> || (OptionalValue<V> && MapValue<typename V::value_type>);

template <typename V>
Result<void> readHeaders(V& out, const ResponseContext& response, const UnmarshallerContext& ctx,
                         const BindingDescriptor& binding) {
    if constexpr (HeaderPrefixMap<V>) {
        // Prefix binding: every header starting with the wire name is one entry
        using MapType = std::conditional_t<OptionalValue<V>, typename V::value_type, V>;
        MapType entries;
        const std::string& prefix = binding.name();
        for (const auto& [name, value] : response.headers) {
            if (name.size() <= prefix.size() ||
                !equalsIgnoreCase(std::string_view(name).substr(0, prefix.size()), prefix)) {
                continue;
            }
            typename MapType::mapped_type element{};
            if (auto r = readHeader(element, value, ctx, *binding.member()); !r) {
                return r;
            }
            entries.insert_or_assign(name.substr(prefix.size()), std::move(element));
        }
        if constexpr (OptionalValue<V>) {
            if (entries.empty()) {
                return {};
            }
        }
        out = std::move(entries);
        return {};
    } else {
        auto it = response.headers.find(binding.name());
        if (it == response.headers.end()) {
            return {};
        }
        return readHeader(out, it->second, ctx, binding);
    }
}

template <typename V> Result<void> readStatus(V& out, int statusCode) {
    if constexpr (std::same_as<V, int32_t> || std::same_as<V, std::optional<int32_t>>) {
        out = statusCode;
        return {};
    } else {
        return Error{ErrorCode::ParseError, "Status code binding needs an int32 member"};
    }
}

} // namespace detail

/**
 * @brief One row of a shape's binding table: a member plus its wire binding
 */
template <typename T> class FieldBinding {
public:
    using MarshalFn =
        std::function<Result<void>(const T&, const BindingDescriptor&, ProtocolMarshaller&)>;
    using ReadFn = std::function<Result<void>(T&, UnmarshallerContext&, const Token&,
                                              const BindingDescriptor&)>;
    using HeaderFn = std::function<Result<void>(T&, const ResponseContext&,
                                                const UnmarshallerContext&,
                                                const BindingDescriptor&)>;
    using StatusFn = std::function<Result<void>(T&, int)>;

    FieldBinding(BindingDescriptor binding, MarshalFn marshal, ReadFn read, HeaderFn headers,
                 StatusFn status)
        : binding_(std::move(binding)), marshal_(std::move(marshal)), read_(std::move(read)),
          headers_(std::move(headers)), status_(std::move(status)) {}

    const BindingDescriptor& binding() const noexcept { return binding_; }

    Result<void> marshall(const T& value, ProtocolMarshaller& marshaller) const {
        return marshal_(value, binding_, marshaller);
    }

    Result<void> read(T& out, UnmarshallerContext& ctx, const Token& first) const {
        return read_(out, ctx, first, binding_);
    }

    Result<void> readHeaders(T& out, const ResponseContext& response,
                             const UnmarshallerContext& ctx) const {
        return headers_(out, response, ctx, binding_);
    }

    Result<void> readStatus(T& out, int statusCode) const { return status_(out, statusCode); }

private:
    BindingDescriptor binding_;
    MarshalFn marshal_;
    ReadFn read_;
    HeaderFn headers_;
    StatusFn status_;
};

/**
 * @brief Declarative per-shape table mapping members to wire bindings
 *
 * The same table drives marshalling (fields in declaration order) and
 * unmarshalling (payload fields looked up by exact wire name). Build it once,
 * e.g. as a function-local static, and share it read-only:
 *
 *   static const FieldBindingTable<Counters> table{
 *       FieldBindingTable<Counters>::field(&Counters::total,
 *                                          BindingDescriptor::payload("total", WireType::Integer)),
 *       ...
 *   };
 */
template <typename T> class FieldBindingTable {
public:
    FieldBindingTable(std::initializer_list<FieldBinding<T>> fields) : fields_(fields) {}

    template <typename M>
    static FieldBinding<T> field(M T::*member, BindingDescriptor binding) {
        static_assert(WireValue<M>, "member type has no wire representation");
        return FieldBinding<T>(
            std::move(binding),
            [member](const T& obj, const BindingDescriptor& b, ProtocolMarshaller& m) {
                return m.marshall(obj.*member, b);
            },
            [member](T& obj, UnmarshallerContext& ctx, const Token& first,
                     const BindingDescriptor& b) {
                return detail::readValue(obj.*member, ctx, first, b);
            },
            [member](T& obj, const ResponseContext& response, const UnmarshallerContext& ctx,
                     const BindingDescriptor& b) {
                return detail::readHeaders(obj.*member, response, ctx, b);
            },
            [member](T& obj, int statusCode) { return detail::readStatus(obj.*member, statusCode); });
    }

    const std::vector<FieldBinding<T>>& fields() const noexcept { return fields_; }

    // Every field, in declaration order; the first failure aborts the pass
    Result<void> marshall(const T& value, ProtocolMarshaller& marshaller) const {
        for (const auto& f : fields_) {
            if (auto r = f.marshall(value, marshaller); !r) {
                return r;
            }
        }
        return {};
    }

    const FieldBinding<T>* findPayloadField(std::string_view name) const {
        for (const auto& f : fields_) {
            if (f.binding().location() == WireLocation::Payload && f.binding().name() == name) {
                return &f;
            }
        }
        return nullptr;
    }

    /**
     * @brief Fill `out` from an object whose start-object token was consumed
     *
     * Reads up to and including the matching end-object. Unknown fields are
     * skipped whole; a null value leaves the field untouched.
     */
    Result<void> unmarshallObject(T& out, UnmarshallerContext& ctx) const {
        for (;;) {
            auto name = ctx.nextToken();
            if (!name) {
                return name.error();
            }
            if (name.value().type == TokenType::EndObject) {
                return {};
            }

            const std::string& fieldName = name.value().text;
            auto first = ctx.nextToken();
            if (!first) {
                return Error::wrap(ErrorCode::ParseError, fieldName, first.error(),
                                   "Unable to unmarshall field");
            }

            const auto* f = findPayloadField(fieldName);
            if (!f) {
                spdlog::debug("Skipping unknown field '{}'", fieldName);
                if (auto r = ctx.skipValue(first.value()); !r) {
                    return r;
                }
                continue;
            }
            if (first.value().type == TokenType::Null) {
                spdlog::trace("Field '{}' is null, left absent", fieldName);
                continue;
            }
            spdlog::trace("Field '{}' <- {}", fieldName, toString(first.value().type));
            if (auto r = f->read(out, ctx, first.value()); !r) {
                return Error::wrap(ErrorCode::ParseError, fieldName, r.error(),
                                   "Unable to unmarshall field");
            }
        }
    }

    // Header and StatusCode bound fields
    Result<void> unmarshallHeaders(T& out, const ResponseContext& response,
                                   const UnmarshallerContext& ctx) const {
        for (const auto& f : fields_) {
            Result<void> r;
            switch (f.binding().location()) {
                case WireLocation::Header:
                    r = f.readHeaders(out, response, ctx);
                    break;
                case WireLocation::StatusCode:
                    r = f.readStatus(out, response.statusCode);
                    break;
                default:
                    continue;
            }
            if (!r) {
                return Error::wrap(ErrorCode::ParseError, f.binding().name(), r.error(),
                                   "Unable to unmarshall field");
            }
        }
        return {};
    }

private:
    std::vector<FieldBinding<T>> fields_;
};

/**
 * @brief Base for shapes whose binding table is `static const FieldBindingTable<Derived>&
 * Derived::bindings()`
 */
template <typename Derived> class Shape : public StructuredValue {
public:
    Result<void> marshallSelf(ProtocolMarshaller& marshaller) const override {
        return Derived::bindings().marshall(static_cast<const Derived&>(*this), marshaller);
    }
};

//-----------------------------------------------------------------------------
// Entry points
//-----------------------------------------------------------------------------

/**
 * @brief Marshall a request shape into a wire-ready request
 * @return InvalidArgument for a null request, MarshallError naming the first
 *         failing field
 */
template <StructuredShape T>
Result<Request> marshallRequest(const T* request, const OperationDescriptor& operation,
                                const config::MarshallingConfig& config = {},
                                const WireTypeRegistry& registry = WireTypeRegistry::standard()) {
    if (!request) {
        return Error{ErrorCode::InvalidArgument, "Request object must not be null"};
    }
    ProtocolMarshaller marshaller(operation, config, registry);
    if (auto r = marshaller.startMarshalling(); !r) {
        return r.error();
    }
    if (auto r = request->marshallSelf(marshaller); !r) {
        return r.error();
    }
    return marshaller.finishMarshalling();
}

namespace detail {

inline Result<void> expectEnd(UnmarshallerContext& ctx) {
    auto end = ctx.atEndOfStream();
    if (!end) {
        return end.error();
    }
    if (!end.value()) {
        return Error{ErrorCode::ParseError, "Unexpected tokens after the top-level value"};
    }
    return {};
}

} // namespace detail

/**
 * @brief Parse one shape from a token stream
 * @return InvalidArgument for a null source, ParseError for malformed or
 *         truncated input
 */
template <StructuredShape T>
Result<T> unmarshall(ITokenSource* tokens,
                     const WireTypeRegistry& registry = WireTypeRegistry::standard()) {
    if (!tokens) {
        return Error{ErrorCode::InvalidArgument, "Token source must not be null"};
    }
    UnmarshallerContext ctx(*tokens, registry);
    auto first = ctx.nextToken();
    if (!first) {
        return first.error();
    }
    if (first.value().type != TokenType::StartObject) {
        return Error{ErrorCode::ParseError, std::string("Expected start-object, got ") +
                                                toString(first.value().type)};
    }
    T out{};
    if (auto r = T::bindings().unmarshallObject(out, ctx); !r) {
        return r.error();
    }
    if (auto r = detail::expectEnd(ctx); !r) {
        return r.error();
    }
    return out;
}

template <StructuredShape T>
Result<T> unmarshall(ITokenSource& tokens,
                     const WireTypeRegistry& registry = WireTypeRegistry::standard()) {
    return unmarshall<T>(&tokens, registry);
}

// Parse a top-level array of shapes
template <StructuredShape T>
Result<std::vector<T>> unmarshallList(ITokenSource& tokens,
                                      const WireTypeRegistry& registry =
                                          WireTypeRegistry::standard()) {
    UnmarshallerContext ctx(tokens, registry);
    auto first = ctx.nextToken();
    if (!first) {
        return first.error();
    }
    if (first.value().type != TokenType::StartArray) {
        return Error{ErrorCode::ParseError, std::string("Expected start-array, got ") +
                                                toString(first.value().type)};
    }
    std::vector<T> items;
    for (;;) {
        auto token = ctx.nextToken();
        if (!token) {
            return token.error();
        }
        if (token.value().type == TokenType::EndArray) {
            break;
        }
        if (token.value().type != TokenType::StartObject) {
            return Error{ErrorCode::ParseError,
                         "Element " + std::to_string(items.size()) + ": expected start-object, got " +
                             toString(token.value().type)};
        }
        T item{};
        if (auto r = T::bindings().unmarshallObject(item, ctx); !r) {
            return Error::wrap(ErrorCode::ParseError, "[" + std::to_string(items.size()) + "]",
                               r.error(), "Invalid list element");
        }
        items.push_back(std::move(item));
    }
    if (auto r = detail::expectEnd(ctx); !r) {
        return r.error();
    }
    return items;
}

/**
 * @brief Parse a response: payload fields from the token stream, Header and
 *        StatusCode fields from `response`
 *
 * An empty token stream (no body) leaves every payload field absent.
 */
template <StructuredShape T>
Result<T> unmarshallResponse(const ResponseContext& response, ITokenSource& tokens,
                             const WireTypeRegistry& registry = WireTypeRegistry::standard()) {
    UnmarshallerContext ctx(tokens, registry);
    T out{};

    auto empty = ctx.atEndOfStream();
    if (!empty) {
        return empty.error();
    }
    if (!empty.value()) {
        auto first = ctx.nextToken();
        if (!first) {
            return first.error();
        }
        if (first.value().type != TokenType::StartObject) {
            return Error{ErrorCode::ParseError, std::string("Expected start-object, got ") +
                                                    toString(first.value().type)};
        }
        if (auto r = T::bindings().unmarshallObject(out, ctx); !r) {
            return r.error();
        }
        if (auto r = detail::expectEnd(ctx); !r) {
            return r.error();
        }
    }

    if (auto r = T::bindings().unmarshallHeaders(out, response, ctx); !r) {
        return r.error();
    }
    return out;
}

} // namespace wirebind
