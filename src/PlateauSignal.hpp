#ifndef PLATEAUSIGNAL_HPP
#define PLATEAUSIGNAL_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace JsonMut {

// anything larger is not a signal file
constexpr size_t MAX_SIGNAL_FILE = 4096;

/*
Reads {"plateau": true|false} written by an external stagnation watcher.
The writer runs on its own schedule, so the file may be missing, stale or
half written; all of that reads as "no plateau".
 */
class PlateauSignal {
  public:
    // disabled: poll() is always false
    PlateauSignal() = default;
    explicit PlateauSignal(std::string path,
                           std::chrono::milliseconds pollInterval =
                               std::chrono::milliseconds(500));

    // re-reads the file at most once per poll interval
    bool poll();

    bool enabled() const { return !path_.empty(); }
    const std::string &path() const { return path_; }

  private:
    std::string path_;
    std::chrono::milliseconds interval_{500};
    std::optional<std::chrono::steady_clock::time_point> lastRead_;
    bool cached_ = false;
};

// one bounded, non-blocking read; false on any failure
bool readPlateauFile(const std::string &path);

// atomic replace via a temp file in the same directory
bool writePlateauFile(const std::string &path, bool plateau);

} // namespace JsonMut

#endif // PLATEAUSIGNAL_HPP
