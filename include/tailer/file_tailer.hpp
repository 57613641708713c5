#pragma once

#include "config/config_types.hpp"

#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace alertwatch {

/**
 * @brief Follows a growing log file, surviving rotation and truncation
 *
 * States: Closed (no handle) and Open. Each poll() performs one step:
 *
 *   Closed  → open, seek to end, fstat the handle for
 *             (device, inode)                                  OPENED
 *           → file missing                                     WAITING
 *   Open    → complete line available, hand it to the handler  LINE
 *           → caught up, path gone                             CLOSED
 *           → caught up, path now a different file (rotation)  ROTATED
 *           → caught up, position past end (truncation)        TRUNCATED
 *           → caught up, nothing changed                       IDLE
 *
 * Content present when the file is opened is never replayed. A trailing
 * fragment without a newline is held back until the line completes.
 *
 * run() loops poll() with the configured sleeps until the stop token
 * fires. Exceptions thrown by the line handler propagate to the caller.
 */
class FileTailer {
public:
    using LineHandler = std::function<void(std::string_view line)>;

    enum class PollResult {
        WAITING,
        OPENED,
        LINE,
        IDLE,
        ROTATED,
        TRUNCATED,
        CLOSED
    };

    using OpenHook = std::function<void()>;

    FileTailer(std::string path, LineHandler handler, TailerConfig config = {});

    ~FileTailer();

    FileTailer(const FileTailer&) = delete;
    FileTailer& operator=(const FileTailer&) = delete;

    [[nodiscard]] PollResult poll();

    void run(std::stop_token stop);

    /**
     * @brief Run a callback right after the file is opened and before its
     * identity is taken (for testing)
     */
    void set_open_hook(OpenHook hook) { open_hook_ = std::move(hook); }

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] uint64_t lines_read() const { return lines_read_; }

private:
    struct FileIdentity {
        dev_t device = 0;
        ino_t inode = 0;

        bool operator==(const FileIdentity&) const = default;
    };

    [[nodiscard]] bool open_file();
    void close_file();
    [[nodiscard]] bool read_line(std::string& line);
    [[nodiscard]] bool fill_buffer();
    [[nodiscard]] PollResult check_file();

    std::string path_;
    LineHandler handler_;
    TailerConfig config_;

    OpenHook open_hook_;

    int fd_ = -1;
    std::optional<FileIdentity> identity_;
    std::string buffer_;                              // bytes read but not yet split into lines
    uint64_t lines_read_ = 0;
};

[[nodiscard]] constexpr std::string_view poll_result_to_string(FileTailer::PollResult r) {
    switch (r) {
        case FileTailer::PollResult::WAITING:   return "waiting";
        case FileTailer::PollResult::OPENED:    return "opened";
        case FileTailer::PollResult::LINE:      return "line";
        case FileTailer::PollResult::IDLE:      return "idle";
        case FileTailer::PollResult::ROTATED:   return "rotated";
        case FileTailer::PollResult::TRUNCATED: return "truncated";
        case FileTailer::PollResult::CLOSED:    return "closed";
        default: return "unknown";
    }
}

} // namespace alertwatch
