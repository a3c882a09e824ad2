#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wirebind/core/types.h>

namespace wirebind {

enum class TokenType : uint8_t {
    StartObject = 0,
    EndObject,
    StartArray,
    EndArray,
    FieldName,
    String,
    Integer,
    Float,
    Boolean,
    Null,
};

const char* toString(TokenType type) noexcept;

/**
 * @brief One structural or scalar parse event
 *
 * Scalars keep their lexical text (numbers exactly as they appeared, booleans
 * as "true"/"false") so decoders never lose precision to an intermediate type.
 */
struct Token {
    TokenType type = TokenType::Null;
    std::string text;

    static Token startObject() { return {TokenType::StartObject, ""}; }
    static Token endObject() { return {TokenType::EndObject, ""}; }
    static Token startArray() { return {TokenType::StartArray, ""}; }
    static Token endArray() { return {TokenType::EndArray, ""}; }
    static Token fieldName(std::string name) { return {TokenType::FieldName, std::move(name)}; }
    static Token string(std::string value) { return {TokenType::String, std::move(value)}; }
    static Token integer(int64_t value) { return {TokenType::Integer, std::to_string(value)}; }
    static Token number(std::string lexeme) { return {TokenType::Float, std::move(lexeme)}; }
    static Token boolean(bool value) { return {TokenType::Boolean, value ? "true" : "false"}; }
    static Token null() { return {TokenType::Null, ""}; }

    bool isScalar() const noexcept {
        return type == TokenType::String || type == TokenType::Integer ||
               type == TokenType::Float || type == TokenType::Boolean || type == TokenType::Null;
    }

    bool operator==(const Token&) const = default;
};

/**
 * @brief Forward-only, single-consumer token source
 *
 * next() yields the following token, std::nullopt once the input is exhausted,
 * or an error when the underlying reader hit malformed input. A source is
 * not restartable.
 */
class ITokenSource {
public:
    virtual ~ITokenSource() = default;

    [[nodiscard]] virtual Result<std::optional<Token>> next() = 0;
};

/**
 * @brief Token source over an in-memory token list
 */
class VectorTokenStream : public ITokenSource {
public:
    explicit VectorTokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Result<std::optional<Token>> next() override;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

/**
 * @brief Token source over a JSON document
 *
 * Not lazy: the first call to next() runs nlohmann::json's SAX reader over the
 * whole document and buffers every token, so memory grows with the document.
 * Later calls only drain that buffer. Tokens that precede a syntax error are
 * still delivered; the error
 * surfaces as a ParseError once they are consumed. A whitespace-only document
 * yields no tokens.
 */
class JsonTokenStream : public ITokenSource {
public:
    explicit JsonTokenStream(std::string document) : document_(std::move(document)) {}

    Result<std::optional<Token>> next() override;

private:
    void tokenize();

    std::string document_;
    std::deque<Token> pending_;
    std::optional<Error> syntaxError_;
    bool tokenized_ = false;
};

} // namespace wirebind
