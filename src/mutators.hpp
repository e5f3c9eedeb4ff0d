#ifndef MUTATORS_HPP
#define MUTATORS_HPP

#include "jsontext.hpp"
#include <array>
#include <optional>
#include <random>
#include <span>
#include <string_view>
#include <vector>

namespace JsonMut {

/*
An operator returns nullopt when it cannot apply to the input; the caller
then substitutes the unmodified seed. Results longer than maxSize are clipped
by applyOperator, never by the caller.
 */
using OperatorFn = std::optional<Bytes> (*)(const Bytes &seed, const Bytes &aux,
                                            size_t maxSize, std::mt19937 &rng);

// Positional identity. Append only: phase ranges and external tooling refer
// to these numbers.
enum class OpIndex : size_t {
    Identity = 0,
    BoolFlip,
    NumericBoundary,
    SyntaxRepair,
    RareToken,
    LongString,
    DeepNesting,
    Utf8Edge,
    DuplicateKey,
    FieldAdd,
    FieldDelete,
    ObjectSplice,
    ArraySplice,
};

class OperatorEntry {
  public:
    OpIndex id;
    std::string_view name;
    OperatorFn fn;
};

enum class Phase { A = 0, B, C };

// --- phase A: safe on any input ---
std::optional<Bytes> op_identity(const Bytes &seed, const Bytes &aux,
                                 size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_bool_flip(const Bytes &seed, const Bytes &aux,
                                  size_t maxSize, std::mt19937 &rng);
// --- phase B ---
std::optional<Bytes> op_numeric_boundary(const Bytes &seed, const Bytes &aux,
                                         size_t maxSize, std::mt19937 &rng);
// --- phase C ---
std::optional<Bytes> op_syntax_repair(const Bytes &seed, const Bytes &aux,
                                      size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_rare_token(const Bytes &seed, const Bytes &aux,
                                   size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_long_string(const Bytes &seed, const Bytes &aux,
                                    size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_deep_nesting(const Bytes &seed, const Bytes &aux,
                                     size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_utf8_edge(const Bytes &seed, const Bytes &aux,
                                  size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_duplicate_key(const Bytes &seed, const Bytes &aux,
                                      size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_field_add(const Bytes &seed, const Bytes &aux,
                                  size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_field_delete(const Bytes &seed, const Bytes &aux,
                                     size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_object_splice(const Bytes &seed, const Bytes &aux,
                                      size_t maxSize, std::mt19937 &rng);
std::optional<Bytes> op_array_splice(const Bytes &seed, const Bytes &aux,
                                     size_t maxSize, std::mt19937 &rng);

inline constexpr std::array OPERATORS = {
    OperatorEntry{OpIndex::Identity, "identity", op_identity},
    OperatorEntry{OpIndex::BoolFlip, "bool-flip", op_bool_flip},
    OperatorEntry{OpIndex::NumericBoundary, "numeric-boundary",
                  op_numeric_boundary},
    OperatorEntry{OpIndex::SyntaxRepair, "syntax-repair", op_syntax_repair},
    OperatorEntry{OpIndex::RareToken, "rare-token", op_rare_token},
    OperatorEntry{OpIndex::LongString, "long-string", op_long_string},
    OperatorEntry{OpIndex::DeepNesting, "deep-nesting", op_deep_nesting},
    OperatorEntry{OpIndex::Utf8Edge, "utf8-edge", op_utf8_edge},
    OperatorEntry{OpIndex::DuplicateKey, "duplicate-key", op_duplicate_key},
    OperatorEntry{OpIndex::FieldAdd, "field-add", op_field_add},
    OperatorEntry{OpIndex::FieldDelete, "field-delete", op_field_delete},
    OperatorEntry{OpIndex::ObjectSplice, "object-splice", op_object_splice},
    OperatorEntry{OpIndex::ArraySplice, "array-splice", op_array_splice},
};

constexpr size_t OPERATOR_COUNT = OPERATORS.size();

constexpr bool registryIsPositional() {
    for (size_t i = 0; i < OPERATORS.size(); ++i) {
        if (static_cast<size_t>(OPERATORS[i].id) != i)
            return false;
    }
    return true;
}
static_assert(registryIsPositional(),
              "operators must sit at the index their OpIndex names");

// exclusive end of each phase's index range; every range starts at 0
constexpr std::array<size_t, 3> PHASE_END = {
    2,              // A: identity, bool-flip
    3,              // B: + numeric-boundary
    OPERATOR_COUNT, // C: everything
};
static_assert(PHASE_END[0] <= PHASE_END[1] && PHASE_END[1] <= PHASE_END[2],
              "curriculum phases must be nested");

using OperatorRegistry = std::span<const OperatorEntry>;

constexpr OperatorRegistry defaultRegistry() { return OPERATORS; }

// allowed operator indices for a phase, limited to the registry's size
std::vector<size_t> allowedOps(Phase phase, size_t registrySize);

// phase in which an index first becomes available
Phase phaseOf(size_t index);

const char *phaseName(Phase phase);

// runs one operator; never throws, result is always <= maxSize
Bytes applyOperator(const OperatorEntry &op, const Bytes &seed,
                    const Bytes &aux, size_t maxSize, std::mt19937 &rng);

// --- helpers shared by operator implementations ---
size_t pickIndex(size_t n, std::mt19937 &rng);
bool chance(double p, std::mt19937 &rng);

} // namespace JsonMut
#endif // MUTATORS_HPP
