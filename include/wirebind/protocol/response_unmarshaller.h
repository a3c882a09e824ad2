#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <wirebind/core/types.h>
#include <wirebind/protocol/binding.h>
#include <wirebind/protocol/request.h>
#include <wirebind/protocol/token_stream.h>
#include <wirebind/protocol/wire_type_registry.h>

namespace wirebind {

/**
 * @brief Non-payload parts of a response
 *
 * Header-bound fields decode from `headers` (case-insensitive names);
 * StatusCode-bound fields receive `statusCode`.
 */
struct ResponseContext {
    int statusCode = 200;
    HeaderMap headers;
};

/**
 * @brief Structural state machine over a token stream
 *
 * Every token handed out by nextToken() has already been checked against the
 * current state:
 *
 *   ExpectStart   top level, any value may follow
 *   InObject      field-name or end-object
 *   InArray       a value or end-array
 *   ExpectScalar  the value of the field just named
 *
 * so readers built on top only deal with well-nested input. Running out of
 * tokens anywhere nextToken() is called is reported as a truncated stream.
 *
 * One context per unmarshall call; it borrows the token source and registry.
 */
class UnmarshallerContext {
public:
    enum class ParseState : uint8_t { ExpectStart = 0, InObject, InArray, ExpectScalar };

    explicit UnmarshallerContext(ITokenSource& tokens,
                                 const WireTypeRegistry& registry = WireTypeRegistry::standard());

    UnmarshallerContext(const UnmarshallerContext&) = delete;
    UnmarshallerContext& operator=(const UnmarshallerContext&) = delete;

    // Next token; ParseError when the stream ends or the token is out of place
    [[nodiscard]] Result<Token> nextToken();

    // True when the source has no further tokens (does not consume anything)
    [[nodiscard]] Result<bool> atEndOfStream();

    // Consume the rest of the value that starts with `first` (nested containers included)
    [[nodiscard]] Result<void> skipValue(const Token& first);

    // Decode a scalar token; decoder failures surface as ParseError
    [[nodiscard]] Result<Scalar> readScalar(const Token& token,
                                            const BindingDescriptor& binding) const;

    // Decode header text; decoder failures surface as ParseError
    [[nodiscard]] Result<Scalar> readText(std::string_view text,
                                          const BindingDescriptor& binding) const;

    ParseState state() const noexcept { return state_; }
    size_t depth() const noexcept { return containers_.size(); }
    const WireTypeRegistry& registry() const noexcept { return registry_; }

private:
    enum class Container : uint8_t { Object, Array };

    Result<void> advance(const Token& token);
    void settle();

    ITokenSource& tokens_;
    const WireTypeRegistry& registry_;
    std::optional<Token> lookahead_;
    std::vector<Container> containers_;
    ParseState state_ = ParseState::ExpectStart;
};

const char* toString(UnmarshallerContext::ParseState state) noexcept;

// DecodeError (or any other code) re-tagged as ParseError, original kept as cause
Error asParseError(Error error);

} // namespace wirebind
