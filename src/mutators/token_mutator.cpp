#include "mutators.hpp"
#include <array>
#include <string>

using namespace JsonMut;

/*
Token-level operators. They work on the raw text and don't need the input
to parse, except utf8-edge which only touches string literals of a valid
document.
 */

constexpr std::array NUMERIC_EDGES = {
    "0",
    "-1",
    "1",
    "-0.0",
    "2147483647",
    "-2147483648",
    "4294967295",
    "9223372036854775807",
    "-9223372036854775808",
    "18446744073709551615",
    "1e308",
    "-1e308",
    "1e999", // overflows to inf in most parsers
    "5e-324",
    "NaN",
};

// raw byte sequences, inserted inside string literals
constexpr std::array<std::string_view, 12> UTF8_EDGES = {
    std::string_view("\xc0\xaf", 2),         // overlong '/'
    std::string_view("\xed\xa0\x80", 3),     // UTF-16 surrogate
    std::string_view("\xef\xbb\xbf", 3),     // BOM
    std::string_view("\xef\xbf\xbf", 3),     // U+FFFF noncharacter
    std::string_view("\xf4\x8f\xbf\xbf", 4), // U+10FFFF
    std::string_view("\xf5\x80\x80\x80", 4), // lead byte past U+10FFFF
    std::string_view("\x80", 1),             // lone continuation
    std::string_view("\xe2\x80\xae", 3),     // RTL override
    std::string_view("\xe2\x80\x8d", 3),     // zero width joiner
    std::string_view("\\ud800", 6),          // escaped lone surrogate
    std::string_view("\\u0000", 6),          // escaped NUL
    std::string_view("\xf0\x9f\x92", 3),     // truncated 4-byte sequence
};

std::optional<Bytes> JsonMut::op_identity(const Bytes &seed, const Bytes &,
                                          size_t maxSize, std::mt19937 &) {
    return clip(seed, maxSize);
}

std::optional<Bytes> JsonMut::op_bool_flip(const Bytes &seed, const Bytes &,
                                           size_t, std::mt19937 &rng) {
    std::vector<Token> bools;
    for (const auto &tok : scanTokens(seed)) {
        if (isLiteral(seed, tok, "true") || isLiteral(seed, tok, "false"))
            bools.push_back(tok);
    }
    if (bools.empty())
        return std::nullopt;

    const auto &tok = bools[pickIndex(bools.size(), rng)];
    const bool wasTrue = isLiteral(seed, tok, "true");
    return replaceSpan(seed, tok.begin, tok.end, wasTrue ? "false" : "true");
}

std::optional<Bytes> JsonMut::op_numeric_boundary(const Bytes &seed,
                                                  const Bytes &, size_t,
                                                  std::mt19937 &rng) {
    std::vector<Token> numbers;
    for (const auto &tok : scanTokens(seed)) {
        if (tok.kind == TokenKind::Number)
            numbers.push_back(tok);
    }
    if (numbers.empty())
        return std::nullopt;

    const auto &tok = numbers[pickIndex(numbers.size(), rng)];
    const auto current = asText(seed).substr(tok.begin, tok.size());
    size_t k = pickIndex(NUMERIC_EDGES.size(), rng);
    // don't burn the trial on a no-op
    if (current == NUMERIC_EDGES[k])
        k = (k + 1) % NUMERIC_EDGES.size();
    return replaceSpan(seed, tok.begin, tok.end, NUMERIC_EDGES[k]);
}

static char closerFor(char opener) { return opener == '{' ? '}' : ']'; }

// drop a ',' that is the last non-whitespace byte
static bool dropDanglingComma(Bytes &out) {
    size_t i = out.size();
    while (i > 0 && (out[i - 1] == ' ' || out[i - 1] == '\t' ||
                     out[i - 1] == '\n' || out[i - 1] == '\r'))
        --i;
    if (i == 0 || out[i - 1] != ',')
        return false;
    out.erase(out.begin() + (i - 1));
    return true;
}

std::optional<Bytes> JsonMut::op_syntax_repair(const Bytes &seed, const Bytes &,
                                               size_t, std::mt19937 &) {
    Bytes out;
    out.reserve(seed.size() + 8);
    std::vector<char> open;
    bool changed = false;
    size_t copied = 0;

    for (const auto &tok : scanTokens(seed)) {
        // whitespace between tokens is kept verbatim
        out.insert(out.end(), seed.begin() + copied, seed.begin() + tok.begin);
        copied = tok.end;

        const char c = static_cast<char>(seed[tok.begin]);
        if (tok.kind == TokenKind::Punct && (c == '{' || c == '[')) {
            open.push_back(c);
        } else if (tok.kind == TokenKind::Punct && (c == '}' || c == ']')) {
            if (open.empty()) {
                // unmatched closer
                changed = true;
                continue;
            }
            changed |= dropDanglingComma(out);
            const char expected = closerFor(open.back());
            open.pop_back();
            if (c != expected) {
                out.push_back(static_cast<uint8_t>(expected));
                changed = true;
                continue;
            }
        }
        out.insert(out.end(), seed.begin() + tok.begin,
                   seed.begin() + tok.end);
        if (tok.kind == TokenKind::String && !tok.terminated) {
            // an odd run of trailing backslashes would escape the quote
            size_t slashes = 0;
            while (slashes + 1 < tok.size() &&
                   seed[tok.end - 1 - slashes] == '\\')
                ++slashes;
            if (slashes % 2 == 1)
                out.pop_back();
            out.push_back('"');
            changed = true;
        }
    }
    out.insert(out.end(), seed.begin() + copied, seed.end());

    changed |= dropDanglingComma(out);
    while (!open.empty()) {
        out.push_back(static_cast<uint8_t>(closerFor(open.back())));
        open.pop_back();
        changed = true;
    }
    if (!changed)
        return std::nullopt;
    return out;
}

std::optional<Bytes> JsonMut::op_utf8_edge(const Bytes &seed, const Bytes &,
                                           size_t, std::mt19937 &rng) {
    if (!isValidJson(seed))
        return std::nullopt;

    std::vector<Token> strings;
    for (const auto &tok : scanTokens(seed)) {
        if (tok.kind == TokenKind::String && tok.terminated && tok.size() >= 2)
            strings.push_back(tok);
    }
    if (strings.empty())
        return std::nullopt;

    const auto &tok = strings[pickIndex(strings.size(), rng)];
    const auto edge = UTF8_EDGES[pickIndex(UTF8_EDGES.size(), rng)];
    // right after the opening quote or right before the closing one, so an
    // escape sequence is never split
    const size_t at = chance(0.5, rng) ? tok.begin + 1 : tok.end - 1;
    return replaceSpan(seed, at, at, edge);
}
