#include "PlateauSignal.hpp"
#include "log.hpp"
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace JsonMut;

JsonMut::PlateauSignal::PlateauSignal(std::string path,
                                      std::chrono::milliseconds pollInterval)
    : path_(std::move(path)), interval_(pollInterval) {}

bool JsonMut::PlateauSignal::poll() {
    if (path_.empty())
        return false;
    const auto now = std::chrono::steady_clock::now();
    if (lastRead_ && now - *lastRead_ < interval_)
        return cached_;
    lastRead_ = now;
    const bool value = readPlateauFile(path_);
    if (value != cached_)
        INFO("plateau signal {} -> {}", path_, value);
    cached_ = value;
    return cached_;
}

static std::optional<std::string> readSmallFile(const std::string &path) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
        return std::nullopt;

    std::string content(MAX_SIGNAL_FILE + 1, '\0');
    size_t total = 0;
    while (total < content.size()) {
        ssize_t n = read(fd, content.data() + total, content.size() - total);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            close(fd);
            return std::nullopt;
        }
        if (n == 0)
            break;
        total += static_cast<size_t>(n);
    }
    close(fd);
    if (total > MAX_SIGNAL_FILE)
        return std::nullopt;
    content.resize(total);
    return content;
}

bool JsonMut::readPlateauFile(const std::string &path) {
    try {
        auto content = readSmallFile(path);
        if (!content)
            return false;
        auto doc = nlohmann::json::parse(*content, nullptr,
                                         /*allow_exceptions=*/false);
        if (doc.is_discarded() || !doc.is_object())
            return false;
        auto it = doc.find("plateau");
        if (it == doc.end() || !it->is_boolean())
            return false;
        return it->get<bool>();
    } catch (const std::exception &e) {
        Log::debug("plateau read {} failed: {}", path, e.what());
    }
    return false;
}

bool JsonMut::writePlateauFile(const std::string &path, bool plateau) {
    const auto ts = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    const nlohmann::json doc = {{"plateau", plateau}, {"ts", ts}};
    const fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(getpid());

    // 1. Write to temp
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            ERROR("cannot create {}", tmp.string());
            return false;
        }
        out << doc.dump() << '\n';
        if (!out.flush()) {
            ERROR("cannot write {}", tmp.string());
            return false;
        }
    }

    // 2. Atomically move
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        ERROR("cannot rename {} -> {}: {}", tmp.string(), path, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
