#include "tailer/file_tailer.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <thread>

namespace alertwatch {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds{100};
constexpr size_t kReadChunk = 8192;

// Sleep in short slices so a stop request is honored promptly
void interruptible_sleep(std::chrono::milliseconds duration, const std::stop_token& stop) {
    while (duration.count() > 0 && !stop.stop_requested()) {
        const auto step = std::min(duration, kSleepSlice);
        std::this_thread::sleep_for(step);
        duration -= step;
    }
}

} // anonymous namespace

FileTailer::FileTailer(std::string path, LineHandler handler, TailerConfig config)
    : path_(std::move(path)),
      handler_(std::move(handler)),
      config_(config) {}

FileTailer::~FileTailer() {
    close_file();
}

bool FileTailer::open_file() {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        if (errno != ENOENT) {
            utils::log::warn(std::format("Cannot open {}: {}", path_, std::strerror(errno)));
        }
        return false;
    }

    if (open_hook_) {
        open_hook_();
    }

    // Identity of the handle itself; the path may already name a newer file
    struct stat st {};
    if (::fstat(fd_, &st) != 0 || ::lseek(fd_, 0, SEEK_END) < 0) {
        utils::log::warn(std::format("Cannot inspect {}: {}", path_, std::strerror(errno)));
        close_file();
        return false;
    }

    identity_ = FileIdentity{st.st_dev, st.st_ino};
    buffer_.clear();
    utils::log::info(std::format("Tailing log file {}", path_));
    return true;
}

void FileTailer::close_file() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    identity_.reset();
    buffer_.clear();
}

bool FileTailer::fill_buffer() {
    char chunk[kReadChunk];
    for (;;) {
        const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            utils::log::warn(std::format("Read from {} failed: {}", path_, std::strerror(errno)));
        }
        return false;
    }
}

bool FileTailer::read_line(std::string& line) {
    for (;;) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line.assign(buffer_, 0, newline);
            buffer_.erase(0, newline + 1);
            return true;
        }
        // No complete line yet: a trailing fragment stays buffered
        if (!fill_buffer()) {
            return false;
        }
    }
}

FileTailer::PollResult FileTailer::check_file() {
    struct stat st {};
    if (::stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            utils::log::warn(std::format("Log file {} disappeared; waiting for it to return", path_));
        } else {
            utils::log::warn(std::format("Cannot stat {}: {}", path_, std::strerror(errno)));
        }
        close_file();
        return PollResult::CLOSED;
    }

    if (identity_ && *identity_ != FileIdentity{st.st_dev, st.st_ino}) {
        utils::log::info("Log rotation detected; reopening file");
        close_file();
        return PollResult::ROTATED;
    }

    const off_t position = ::lseek(fd_, 0, SEEK_CUR);
    if (position > st.st_size) {
        utils::log::info(std::format("Log file {} truncated; reading from start", path_));
        if (::lseek(fd_, 0, SEEK_SET) < 0) {
            close_file();
            return PollResult::CLOSED;
        }
        buffer_.clear();
        return PollResult::TRUNCATED;
    }

    return PollResult::IDLE;
}

FileTailer::PollResult FileTailer::poll() {
    if (fd_ < 0) {
        return open_file() ? PollResult::OPENED : PollResult::WAITING;
    }

    std::string line;
    if (read_line(line)) {
        ++lines_read_;
        handler_(line);
        return PollResult::LINE;
    }

    return check_file();
}

void FileTailer::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        const PollResult result = poll();
        switch (result) {
            case PollResult::LINE:
            case PollResult::OPENED:
                break;
            case PollResult::ROTATED:
            case PollResult::TRUNCATED:
            case PollResult::CLOSED:
                utils::log::debug(std::format("Tailer {}: {}", path_, poll_result_to_string(result)));
                break;
            case PollResult::WAITING:
                interruptible_sleep(config_.reopen_backoff, stop);
                break;
            case PollResult::IDLE:
                interruptible_sleep(config_.idle_interval, stop);
                break;
        }
    }
}

} // namespace alertwatch
