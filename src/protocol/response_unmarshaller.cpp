#include <wirebind/protocol/response_unmarshaller.h>

#include <spdlog/spdlog.h>

namespace wirebind {

const char* toString(UnmarshallerContext::ParseState state) noexcept {
    switch (state) {
        case UnmarshallerContext::ParseState::ExpectStart:
            return "ExpectStart";
        case UnmarshallerContext::ParseState::InObject:
            return "InObject";
        case UnmarshallerContext::ParseState::InArray:
            return "InArray";
        case UnmarshallerContext::ParseState::ExpectScalar:
            return "ExpectScalar";
    }
    return "Unknown";
}

Error asParseError(Error error) {
    if (error.code == ErrorCode::ParseError) {
        return error;
    }
    Error wrapped{ErrorCode::ParseError, error.message};
    wrapped.field = error.field;
    wrapped.cause = std::make_shared<const Error>(std::move(error));
    return wrapped;
}

UnmarshallerContext::UnmarshallerContext(ITokenSource& tokens, const WireTypeRegistry& registry)
    : tokens_(tokens), registry_(registry) {}

Result<Token> UnmarshallerContext::nextToken() {
    std::optional<Token> token;
    if (lookahead_) {
        token = std::move(lookahead_);
        lookahead_.reset();
    } else {
        auto pulled = tokens_.next();
        if (!pulled) {
            return asParseError(pulled.error());
        }
        token = std::move(pulled).value();
    }

    if (!token) {
        return Error{ErrorCode::ParseError,
                     "Truncated token stream: input ended in state " +
                         std::string(toString(state_)) + " at depth " +
                         std::to_string(containers_.size())};
    }
    if (auto ok = advance(*token); !ok) {
        return ok.error();
    }
    return std::move(*token);
}

Result<bool> UnmarshallerContext::atEndOfStream() {
    if (lookahead_) {
        return false;
    }
    auto pulled = tokens_.next();
    if (!pulled) {
        return asParseError(pulled.error());
    }
    lookahead_ = std::move(pulled).value();
    return !lookahead_.has_value();
}

Result<void> UnmarshallerContext::advance(const Token& token) {
    auto unexpected = [&]() {
        return Error{ErrorCode::ParseError, std::string("Unexpected ") + toString(token.type) +
                                                " token in state " + toString(state_)};
    };

    switch (token.type) {
        case TokenType::FieldName:
            if (state_ != ParseState::InObject) {
                return unexpected();
            }
            state_ = ParseState::ExpectScalar;
            return {};
        case TokenType::EndObject:
            if (state_ != ParseState::InObject || containers_.empty() ||
                containers_.back() != Container::Object) {
                return unexpected();
            }
            containers_.pop_back();
            settle();
            return {};
        case TokenType::EndArray:
            if (state_ != ParseState::InArray || containers_.empty() ||
                containers_.back() != Container::Array) {
                return unexpected();
            }
            containers_.pop_back();
            settle();
            return {};
        default:
            break;
    }

    // A value: legal anywhere except directly inside an object
    if (state_ == ParseState::InObject) {
        return unexpected();
    }
    if (token.type == TokenType::StartObject) {
        containers_.push_back(Container::Object);
    } else if (token.type == TokenType::StartArray) {
        containers_.push_back(Container::Array);
    }
    settle();
    return {};
}

void UnmarshallerContext::settle() {
    if (containers_.empty()) {
        state_ = ParseState::ExpectStart;
    } else {
        state_ = containers_.back() == Container::Object ? ParseState::InObject
                                                         : ParseState::InArray;
    }
}

Result<void> UnmarshallerContext::skipValue(const Token& first) {
    if (first.type != TokenType::StartObject && first.type != TokenType::StartArray) {
        if (!first.isScalar()) {
            return Error{ErrorCode::ParseError,
                         std::string("Cannot skip a value starting with ") + toString(first.type)};
        }
        return {};
    }

    // `first` already opened a container; consume until it closes
    const size_t target = containers_.size() - 1;
    while (containers_.size() > target) {
        auto token = nextToken();
        if (!token) {
            return token.error();
        }
    }
    return {};
}

Result<Scalar> UnmarshallerContext::readScalar(const Token& token,
                                               const BindingDescriptor& binding) const {
    auto value = registry_.decodeToken(token, binding);
    if (!value) {
        return asParseError(value.error());
    }
    return value;
}

Result<Scalar> UnmarshallerContext::readText(std::string_view text,
                                             const BindingDescriptor& binding) const {
    auto value = registry_.decodeText(text, binding);
    if (!value) {
        return asParseError(value.error());
    }
    return value;
}

} // namespace wirebind
