#ifndef JSONTEXT_HPP
#define JSONTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace JsonMut {

using Bytes = std::vector<uint8_t>;

// documents nested deeper than this are never handed to the parser
constexpr size_t MAX_PARSE_DEPTH = 512;

constexpr std::string_view PLACEHOLDER_DOC = "{}";

enum class TokenKind { String, Number, Literal, Punct, Invalid };

class Token {
  public:
    TokenKind kind;
    // [begin, end) into the scanned buffer
    size_t begin = 0;
    size_t end = 0;
    // only meaningful for String
    bool terminated = true;

    size_t size() const { return end - begin; }
};

inline Bytes clip(const Bytes &data, size_t maxSize) {
    if (data.size() <= maxSize)
        return data;
    return Bytes(data.begin(), data.begin() + maxSize);
}

inline Bytes toBytes(std::string_view s) { return Bytes(s.begin(), s.end()); }

inline std::string_view asText(const Bytes &data) {
    return {reinterpret_cast<const char *>(data.data()), data.size()};
}

// "{}" cut down to maxSize
inline Bytes placeholder(size_t maxSize) {
    return clip(toBytes(PLACEHOLDER_DOC), maxSize);
}

/*
Lenient tokenizer: never fails, works on broken or binary input.
String tokens include their quotes; an unterminated string runs to the end
of the buffer with terminated=false. Whitespace is not reported.
 */
std::vector<Token> scanTokens(const Bytes &data);

// max bracket/brace depth outside string literals
size_t nestingDepth(const Bytes &data);

// structural validity check used for parse statistics
bool isValidJson(const Bytes &data);

// nullopt on any parse failure or excessive nesting
std::optional<nlohmann::json> parseJson(const Bytes &data);

// compact dump; nullopt if it does not fit in maxSize
std::optional<Bytes> dumpJson(const nlohmann::json &doc, size_t maxSize);

bool isLiteral(const Bytes &data, const Token &tok, std::string_view word);

Bytes replaceSpan(const Bytes &data, size_t begin, size_t end,
                  std::string_view with);

} // namespace JsonMut

#endif // JSONTEXT_HPP
