#ifndef LOGH
#define LOGH

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#define INFO Log::info
#define ERROR Log::error
#define PANIC Log::panic

namespace Log {

inline constexpr const char *RED = "\033[0;31m";
inline constexpr const char *RESET = "\033[0m";

enum class Level { Debug = 0, Info, Warn, Error, Off };

// plugin runs under the host's terminal UI, so nothing goes to stdout
inline Level &threshold() {
    static Level level = Level::Warn;
    return level;
}

inline std::unique_ptr<std::ofstream> &fileSink() {
    static std::unique_ptr<std::ofstream> sink;
    return sink;
}

inline std::ostream &sink() {
    auto &file = fileSink();
    if (file && *file)
        return *file;
    return std::cerr;
}

inline bool enabled(Level level) { return level >= threshold(); }

inline void setLevel(Level level) { threshold() = level; }

// "debug" | "info" | "warn" | "error" | "off"; false on unknown names
inline bool setLevel(const std::string &name) {
    if (name == "debug")
        threshold() = Level::Debug;
    else if (name == "info")
        threshold() = Level::Info;
    else if (name == "warn")
        threshold() = Level::Warn;
    else if (name == "error")
        threshold() = Level::Error;
    else if (name == "off")
        threshold() = Level::Off;
    else
        return false;
    return true;
}

// falls back to stderr if the file can't be opened
inline bool openFile(const std::string &path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*file)
        return false;
    fileSink() = std::move(file);
    return true;
}

inline void closeFile() { fileSink().reset(); }

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args &&...args) {
#ifndef DISABLE_DEBUG_OUTPUT
    if (enabled(Level::Debug))
        sink() << "[jsonmut] "
               << std::format(fmt, std::forward<Args>(args)...) << std::endl;
#endif
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args &&...args) {
#ifndef DISABLE_INFO_OUTPUT
    if (enabled(Level::Info))
        sink() << "[jsonmut] "
               << std::format(fmt, std::forward<Args>(args)...) << std::endl;
#endif
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::Warn))
        sink() << "[jsonmut] warning: "
               << std::format(fmt, std::forward<Args>(args)...) << std::endl;
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args &&...args) {
    if (enabled(Level::Error))
        sink() << RED << "[jsonmut] "
               << std::format(fmt, std::forward<Args>(args)...) << RESET
               << std::endl;
}

// only for standalone tools; never reachable from the plugin
template <typename... Args>
[[noreturn]] void __attribute__((noreturn))
panic(std::format_string<Args...> fmt, Args &&...args) {
    std::cerr << RED << std::format(fmt, std::forward<Args>(args)...) << RESET
              << std::endl;
    std::exit(EXIT_FAILURE);
}
} // namespace Log

#endif // LOGH
