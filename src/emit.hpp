#ifndef EMIT_HPP
#define EMIT_HPP
#include "jsontext.hpp"
#include <string>
#include <vector>

namespace JsonMut {
constexpr size_t MAX_CACHE_SIZE = 100;

// regular files under savedPath, in path order; unreadable files are skipped
std::vector<Bytes> loadSeeds(const std::string &savedPath);

// writes through <outDir>/.tmp and renames into <outDir>; returns the
// number of files emitted
size_t emitOutputs(const std::string &outDir,
                   const std::vector<Bytes> &outputs);
std::string make_unique_filename(int counter);

// dedup key for an output; hashes the bytes without copying them
size_t outputHash(const Bytes &out);
} // namespace JsonMut

#endif // EMIT_HPP
