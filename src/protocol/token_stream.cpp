#include <wirebind/protocol/token_stream.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace wirebind {

const char* toString(TokenType type) noexcept {
    switch (type) {
        case TokenType::StartObject:
            return "start-object";
        case TokenType::EndObject:
            return "end-object";
        case TokenType::StartArray:
            return "start-array";
        case TokenType::EndArray:
            return "end-array";
        case TokenType::FieldName:
            return "field-name";
        case TokenType::String:
            return "string";
        case TokenType::Integer:
            return "integer";
        case TokenType::Float:
            return "float";
        case TokenType::Boolean:
            return "boolean";
        case TokenType::Null:
            return "null";
    }
    return "unknown";
}

Result<std::optional<Token>> VectorTokenStream::next() {
    if (pos_ >= tokens_.size()) {
        return std::optional<Token>{};
    }
    return std::optional<Token>{tokens_[pos_++]};
}

namespace {

// Collects SAX events as tokens; stops at the first syntax error
class TokenCollector : public nlohmann::json_sax<nlohmann::json> {
public:
    explicit TokenCollector(std::deque<Token>& out) : out_(out) {}

    bool null() override {
        out_.push_back(Token::null());
        return true;
    }
    bool boolean(bool val) override {
        out_.push_back(Token::boolean(val));
        return true;
    }
    bool number_integer(number_integer_t val) override {
        out_.push_back(Token::integer(val));
        return true;
    }
    bool number_unsigned(number_unsigned_t val) override {
        out_.push_back({TokenType::Integer, std::to_string(val)});
        return true;
    }
    bool number_float(number_float_t, const string_t& s) override {
        out_.push_back(Token::number(s));
        return true;
    }
    bool string(string_t& val) override {
        out_.push_back(Token::string(val));
        return true;
    }
    bool binary(binary_t&) override {
        // Not produced by the JSON reader
        return false;
    }
    bool start_object(std::size_t) override {
        out_.push_back(Token::startObject());
        return true;
    }
    bool key(string_t& val) override {
        out_.push_back(Token::fieldName(val));
        return true;
    }
    bool end_object() override {
        out_.push_back(Token::endObject());
        return true;
    }
    bool start_array(std::size_t) override {
        out_.push_back(Token::startArray());
        return true;
    }
    bool end_array() override {
        out_.push_back(Token::endArray());
        return true;
    }
    bool parse_error(std::size_t position, const std::string& lastToken,
                     const nlohmann::detail::exception& ex) override {
        error_ = Error{ErrorCode::ParseError, "Malformed JSON at byte " +
                                                  std::to_string(position) + " near '" +
                                                  lastToken + "': " + ex.what()};
        return false;
    }

    const std::optional<Error>& error() const { return error_; }

private:
    std::deque<Token>& out_;
    std::optional<Error> error_;
};

bool isBlank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

void JsonTokenStream::tokenize() {
    tokenized_ = true;
    if (isBlank(document_)) {
        return;
    }
    TokenCollector collector(pending_);
    bool ok = nlohmann::json::sax_parse(document_, &collector);
    if (!ok) {
        syntaxError_ = collector.error().value_or(
            Error{ErrorCode::ParseError, "JSON tokenizer stopped without an error"});
        spdlog::debug("JsonTokenStream: {} ({} tokens before failure)", syntaxError_->message,
                      pending_.size());
    }
}

Result<std::optional<Token>> JsonTokenStream::next() {
    if (!tokenized_) {
        tokenize();
    }
    if (!pending_.empty()) {
        Token t = std::move(pending_.front());
        pending_.pop_front();
        return std::optional<Token>{std::move(t)};
    }
    if (syntaxError_) {
        return *syntaxError_;
    }
    return std::optional<Token>{};
}

} // namespace wirebind
