#include "emit.hpp"
#include "log.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <set>
#include <string>

namespace fs = std::filesystem;
using namespace JsonMut;

// Generate unique filename using timestamp + counter
std::string JsonMut::make_unique_filename(int counter) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return std::to_string(millis) + "_" + std::to_string(counter) + ".json";
}

size_t JsonMut::outputHash(const Bytes &out) {
    return std::hash<std::string_view>{}(asText(out));
}

std::vector<Bytes> JsonMut::loadSeeds(const std::string &savedPath) {
    std::vector<Bytes> seeds;
    std::set<std::string> pathes;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(savedPath, ec)) {
        if (entry.is_regular_file())
            pathes.insert(entry.path().string());
    }
    if (ec) {
        ERROR("cannot list {}: {}", savedPath, ec.message());
        return seeds;
    }
    for (const auto &entry : pathes) {
        std::ifstream in(entry, std::ios::binary);
        if (!in) {
            Log::warn("skipping unreadable seed {}", entry);
            continue;
        }
        seeds.emplace_back(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }
    return seeds;
}

size_t JsonMut::emitOutputs(const std::string &outDir,
                            const std::vector<Bytes> &outputs) {
    const fs::path tmpDir = fs::path(outDir) / ".tmp";
    std::error_code ec;
    fs::create_directories(tmpDir, ec);
    if (ec) {
        ERROR("cannot create {}: {}", tmpDir.string(), ec.message());
        return 0;
    }

    static int counter = 0;
    size_t emitted = 0;
    for (size_t i = 0; i < outputs.size(); ++i) {
        std::string filename = make_unique_filename(counter++);
        fs::path tmpPath = tmpDir / filename;
        fs::path queuePath = fs::path(outDir) / filename;

        // 1. Write to temp
        {
            std::ofstream out(tmpPath, std::ios::binary);
            out.write(reinterpret_cast<const char *>(outputs[i].data()),
                      static_cast<std::streamsize>(outputs[i].size()));
            if (!out) {
                ERROR("cannot write {}", tmpPath.string());
                continue;
            }
        }

        // 2. Atomically move
        fs::rename(tmpPath, queuePath, ec);
        if (ec) {
            ERROR("cannot move {}: {}", tmpPath.string(), ec.message());
            continue;
        }
        ++emitted;
    }
    return emitted;
}
