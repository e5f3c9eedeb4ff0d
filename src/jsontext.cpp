#include "jsontext.hpp"
#include <algorithm>

using namespace JsonMut;

static bool isSpace(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static bool isNumberStart(uint8_t c) {
    return c == '-' || (c >= '0' && c <= '9');
}

static bool isNumberChar(uint8_t c) {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' ||
           c == 'e' || c == 'E';
}

static bool isWordChar(uint8_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static size_t skipString(const Bytes &data, size_t pos, bool &terminated) {
    // pos points at the opening quote
    size_t i = pos + 1;
    while (i < data.size()) {
        if (data[i] == '\\') {
            i += 2;
            continue;
        }
        if (data[i] == '"') {
            terminated = true;
            return i + 1;
        }
        ++i;
    }
    terminated = false;
    return data.size();
}

std::vector<Token> JsonMut::scanTokens(const Bytes &data) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < data.size()) {
        const uint8_t c = data[i];
        if (isSpace(c)) {
            ++i;
            continue;
        }
        Token tok{TokenKind::Invalid, i, i + 1};
        if (c == '"') {
            tok.kind = TokenKind::String;
            tok.end = skipString(data, i, tok.terminated);
        } else if (isNumberStart(c)) {
            size_t j = i + 1;
            while (j < data.size() && isNumberChar(data[j]))
                ++j;
            tok.kind = TokenKind::Number;
            tok.end = j;
        } else if (isWordChar(c)) {
            size_t j = i + 1;
            while (j < data.size() && isWordChar(data[j]))
                ++j;
            tok.kind = TokenKind::Literal;
            tok.end = j;
        } else if (c == '{' || c == '}' || c == '[' || c == ']' || c == ',' ||
                   c == ':') {
            tok.kind = TokenKind::Punct;
        }
        tokens.push_back(tok);
        i = tok.end;
    }
    return tokens;
}

size_t JsonMut::nestingDepth(const Bytes &data) {
    size_t depth = 0;
    size_t maxDepth = 0;
    size_t i = 0;
    while (i < data.size()) {
        const uint8_t c = data[i];
        if (c == '"') {
            bool terminated;
            i = skipString(data, i, terminated);
            continue;
        }
        if (c == '{' || c == '[') {
            maxDepth = std::max(maxDepth, ++depth);
        } else if ((c == '}' || c == ']') && depth > 0) {
            --depth;
        }
        ++i;
    }
    return maxDepth;
}

bool JsonMut::isValidJson(const Bytes &data) {
    if (data.empty() || nestingDepth(data) > MAX_PARSE_DEPTH)
        return false;
    return nlohmann::json::accept(data.begin(), data.end());
}

std::optional<nlohmann::json> JsonMut::parseJson(const Bytes &data) {
    if (data.empty() || nestingDepth(data) > MAX_PARSE_DEPTH)
        return std::nullopt;
    auto doc = nlohmann::json::parse(data.begin(), data.end(), nullptr,
                                     /*allow_exceptions=*/false);
    if (doc.is_discarded())
        return std::nullopt;
    return doc;
}

std::optional<Bytes> JsonMut::dumpJson(const nlohmann::json &doc,
                                       size_t maxSize) {
    const std::string text =
        doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > maxSize)
        return std::nullopt;
    return toBytes(text);
}

bool JsonMut::isLiteral(const Bytes &data, const Token &tok,
                        std::string_view word) {
    return tok.kind == TokenKind::Literal &&
           asText(data).substr(tok.begin, tok.size()) == word;
}

Bytes JsonMut::replaceSpan(const Bytes &data, size_t begin, size_t end,
                           std::string_view with) {
    Bytes out;
    out.reserve(data.size() - (end - begin) + with.size());
    out.insert(out.end(), data.begin(), data.begin() + begin);
    out.insert(out.end(), with.begin(), with.end());
    out.insert(out.end(), data.begin() + end, data.end());
    return out;
}
