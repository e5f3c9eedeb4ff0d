#include "mutators.hpp"
#include <algorithm>
#include <array>
#include <iterator>
#include <string>

using namespace JsonMut;
using json = nlohmann::json;

/*
Structural operators: parse the seed, edit the tree, dump it compactly.
Unparseable input or a result that doesn't fit maxSize -> nullopt, and the
caller falls back to the seed.
 */

constexpr size_t MAX_LONG_STRING = 64 * 1024;
constexpr size_t MIN_NESTING = 8;
constexpr size_t MAX_NESTING = 64;
// bytes added per level by the costliest wrapper, {"a":...}
constexpr size_t NESTING_LEVEL_COST = 6;

// Stand-in value replaced by raw text after dumping. The serializer escapes
// control characters, which gives the dumped form below.
static const std::string RAW_MARK = "\x01jsonmut\x02";
static const std::string RAW_MARK_DUMPED = "\"\\u0001jsonmut\\u0002\"";

// kept as text: most of these don't survive a parse/dump round
constexpr std::array RARE_VALUES = {
    "null",
    "\"\"",
    "\"\\u0000\"",
    "\"\\uffff\"",
    "\"\\ud83d\\ude00\"",
    "-0",
    "1e-400",
    "-1E+2",
    "0.0000000000000000000000001",
    "123456789012345678901234567890",
    "[]",
    "{}",
    "[[]]",
    "{\"\":null}",
    "\"__proto__\"",
};

static const std::array<std::string, 6> RARE_KEYS = {
    "__proto__", "constructor", "prototype", "$ref", "", std::string(1, '\0'),
};

static std::vector<json *> collectNodes(json &root) {
    std::vector<json *> nodes;
    std::vector<json *> stack{&root};
    while (!stack.empty()) {
        json *node = stack.back();
        stack.pop_back();
        nodes.push_back(node);
        if (node->is_structured()) {
            for (auto &child : *node)
                stack.push_back(&child);
        }
    }
    return nodes;
}

template <typename Pred>
static std::vector<json *> collectNodes(json &root, Pred pred) {
    auto nodes = collectNodes(root);
    std::erase_if(nodes, [&](json *node) { return !pred(*node); });
    return nodes;
}

// any value, preferring non-root ones
static json *pickValue(json &root, std::mt19937 &rng) {
    auto nodes = collectNodes(root);
    if (nodes.size() > 1)
        return nodes[1 + pickIndex(nodes.size() - 1, rng)];
    return nodes[0];
}

static std::string randomKey(std::mt19937 &rng, size_t n = 8) {
    static constexpr std::string_view alpha =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    std::string key;
    key.reserve(n);
    for (size_t i = 0; i < n; ++i)
        key.push_back(alpha[pickIndex(alpha.size(), rng)]);
    return key;
}

static json simpleValue(std::mt19937 &rng) {
    switch (pickIndex(7, rng)) {
    case 0:
        return nullptr;
    case 1:
        return true;
    case 2:
        return false;
    case 3:
        return randomKey(rng);
    case 4:
        return std::uniform_int_distribution<int>(-100, 100)(rng);
    case 5:
        return json::array();
    default:
        return json::object();
    }
}

static size_t dumpedSize(const json &doc) {
    return doc.dump(-1, ' ', false, json::error_handler_t::replace).size();
}

// dump, then swap the single RAW_MARK occurrence for raw text
static std::optional<Bytes> dumpWithRaw(const json &doc, std::string_view raw,
                                        size_t maxSize) {
    std::string text = doc.dump(-1, ' ', false, json::error_handler_t::replace);
    const size_t at = text.find(RAW_MARK_DUMPED);
    if (at == std::string::npos ||
        text.find(RAW_MARK_DUMPED, at + 1) != std::string::npos)
        return std::nullopt;
    text.replace(at, RAW_MARK_DUMPED.size(), raw);
    if (text.size() > maxSize)
        return std::nullopt;
    return toBytes(text);
}

std::optional<Bytes> JsonMut::op_rare_token(const Bytes &seed, const Bytes &,
                                            size_t maxSize, std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    if (chance(0.3, rng)) {
        auto objects =
            collectNodes(*doc, [](const json &n) { return n.is_object(); });
        if (!objects.empty()) {
            json *obj = objects[pickIndex(objects.size(), rng)];
            (*obj)[RARE_KEYS[pickIndex(RARE_KEYS.size(), rng)]] =
                simpleValue(rng);
            return dumpJson(*doc, maxSize);
        }
    }

    json *slot = pickValue(*doc, rng);
    *slot = RAW_MARK;
    return dumpWithRaw(*doc, RARE_VALUES[pickIndex(RARE_VALUES.size(), rng)],
                       maxSize);
}

std::optional<Bytes> JsonMut::op_long_string(const Bytes &seed, const Bytes &,
                                             size_t maxSize,
                                             std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    const size_t current = dumpedSize(*doc);
    // 2 bytes for the quotes
    if (current + 2 + 8 > maxSize)
        return std::nullopt;
    const size_t room = std::min(maxSize - current - 2, MAX_LONG_STRING);
    const size_t len = std::uniform_int_distribution<size_t>(8, room)(rng);

    std::string s;
    s.reserve(len);
    switch (pickIndex(3, rng)) {
    case 0:
        s.assign(len, 'A');
        break;
    case 1:
        while (s.size() < len)
            s.append(s.size() % 2 ? "b" : "a");
        break;
    default: {
        // printable ASCII minus '"' and '\\', so nothing gets escaped
        std::uniform_int_distribution<int> printable(0x20, 0x7e);
        while (s.size() < len) {
            const char c = static_cast<char>(printable(rng));
            if (c != '"' && c != '\\')
                s.push_back(c);
        }
        break;
    }
    }

    *pickValue(*doc, rng) = std::move(s);
    return dumpJson(*doc, maxSize);
}

std::optional<Bytes> JsonMut::op_deep_nesting(const Bytes &seed, const Bytes &,
                                              size_t maxSize,
                                              std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    const size_t depth = nestingDepth(seed);
    const size_t current = dumpedSize(*doc);
    if (depth >= MAX_PARSE_DEPTH || current >= maxSize)
        return std::nullopt;

    size_t levels =
        std::uniform_int_distribution<size_t>(MIN_NESTING, MAX_NESTING)(rng);
    levels = std::min({levels, MAX_PARSE_DEPTH - depth,
                       (maxSize - current) / NESTING_LEVEL_COST});
    if (levels == 0)
        return std::nullopt;

    json *slot = pickValue(*doc, rng);
    json value = std::move(*slot);
    const bool arrays = chance(0.5, rng);
    for (size_t i = 0; i < levels; ++i) {
        json wrapper;
        if (arrays || (i % 2 == 1 && chance(0.5, rng))) {
            wrapper = json::array();
            wrapper.push_back(std::move(value));
        } else {
            wrapper = json::object();
            wrapper["a"] = std::move(value);
        }
        value = std::move(wrapper);
    }
    *slot = std::move(value);
    return dumpJson(*doc, maxSize);
}

std::optional<Bytes> JsonMut::op_duplicate_key(const Bytes &seed, const Bytes &,
                                               size_t maxSize,
                                               std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    auto objects = collectNodes(
        *doc, [](const json &n) { return n.is_object() && !n.empty(); });
    if (objects.empty())
        return std::nullopt;

    json *obj = objects[pickIndex(objects.size(), rng)];
    auto it = obj->begin();
    std::advance(it, static_cast<std::ptrdiff_t>(
                               pickIndex(obj->size(), rng)));
    const std::string key = it.key();
    json value = chance(0.5, rng) ? it.value() : simpleValue(rng);

    // the object can't hold the key twice, so emit it under the marker and
    // rename it in the text
    (*obj)[RAW_MARK] = std::move(value);
    const std::string keyText =
        json(key).dump(-1, ' ', false, json::error_handler_t::replace);
    return dumpWithRaw(*doc, keyText, maxSize);
}

std::optional<Bytes> JsonMut::op_field_add(const Bytes &seed, const Bytes &,
                                           size_t maxSize, std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    auto objects =
        collectNodes(*doc, [](const json &n) { return n.is_object(); });
    if (!objects.empty()) {
        json *obj = objects[pickIndex(objects.size(), rng)];
        (*obj)[randomKey(rng)] = simpleValue(rng);
        return dumpJson(*doc, maxSize);
    }

    auto arrays = collectNodes(*doc, [](const json &n) { return n.is_array(); });
    if (arrays.empty())
        return std::nullopt;
    arrays[pickIndex(arrays.size(), rng)]->push_back(simpleValue(rng));
    return dumpJson(*doc, maxSize);
}

std::optional<Bytes> JsonMut::op_field_delete(const Bytes &seed, const Bytes &,
                                              size_t maxSize,
                                              std::mt19937 &rng) {
    auto doc = parseJson(seed);
    if (!doc)
        return std::nullopt;

    auto objects = collectNodes(
        *doc, [](const json &n) { return n.is_object() && !n.empty(); });
    if (!objects.empty()) {
        json *obj = objects[pickIndex(objects.size(), rng)];
        auto it = obj->begin();
        std::advance(it, static_cast<std::ptrdiff_t>(
                               pickIndex(obj->size(), rng)));
        obj->erase(it);
        return dumpJson(*doc, maxSize);
    }

    auto arrays = collectNodes(
        *doc, [](const json &n) { return n.is_array() && !n.empty(); });
    if (arrays.empty())
        return std::nullopt;
    json *arr = arrays[pickIndex(arrays.size(), rng)];
    arr->erase(pickIndex(arr->size(), rng));
    return dumpJson(*doc, maxSize);
}

std::optional<Bytes> JsonMut::op_object_splice(const Bytes &seed,
                                               const Bytes &aux, size_t maxSize,
                                               std::mt19937 &rng) {
    auto doc = parseJson(seed);
    auto donor = parseJson(aux);
    if (!doc || !donor)
        return std::nullopt;

    auto targets =
        collectNodes(*doc, [](const json &n) { return n.is_object(); });
    auto sources = collectNodes(
        *donor, [](const json &n) { return n.is_object() && !n.empty(); });
    if (targets.empty() || sources.empty())
        return std::nullopt;

    json *dst = targets[pickIndex(targets.size(), rng)];
    const json *src = sources[pickIndex(sources.size(), rng)];
    const size_t n = std::uniform_int_distribution<size_t>(
        1, std::min<size_t>(4, src->size()))(rng);
    for (size_t i = 0; i < n; ++i) {
        auto it = src->begin();
        std::advance(it, static_cast<std::ptrdiff_t>(
                               pickIndex(src->size(), rng)));
        (*dst)[it.key()] = it.value();
    }
    return dumpJson(*doc, maxSize);
}

std::optional<Bytes> JsonMut::op_array_splice(const Bytes &seed,
                                              const Bytes &aux, size_t maxSize,
                                              std::mt19937 &rng) {
    auto doc = parseJson(seed);
    auto donor = parseJson(aux);
    if (!doc || !donor)
        return std::nullopt;

    auto targets = collectNodes(*doc, [](const json &n) { return n.is_array(); });
    auto sources = collectNodes(
        *donor, [](const json &n) { return n.is_array() && !n.empty(); });
    if (targets.empty() || sources.empty())
        return std::nullopt;

    json *dst = targets[pickIndex(targets.size(), rng)];
    const json *src = sources[pickIndex(sources.size(), rng)];
    const size_t start = pickIndex(src->size(), rng);
    const size_t len = std::uniform_int_distribution<size_t>(
        1, std::min<size_t>(8, src->size() - start))(rng);
    const size_t at = std::uniform_int_distribution<size_t>(0, dst->size())(rng);

    dst->insert(dst->begin() + static_cast<std::ptrdiff_t>(at),
                src->begin() + static_cast<std::ptrdiff_t>(start),
                src->begin() + static_cast<std::ptrdiff_t>(start + len));
    return dumpJson(*doc, maxSize);
}
