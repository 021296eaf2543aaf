#pragma once

#include <cerrno>
#include <optional>
#include <string>
#include <system_error>

#include <unistd.h>

#include "corochain.hpp"
#include "poller.hpp"

namespace NRelay {

/**
 * @class TFileHandle
 * @brief Non-blocking descriptor read through the poller. Owns the descriptor.
 *
 * Used for the console input; the descriptor is switched to O_NONBLOCK on
 * construction and closed on destruction.
 */
class TFileHandle {
public:
    TFileHandle() = default;
    TFileHandle(int fd, TPollerBase& poller);

    TFileHandle(TFileHandle&& other);
    TFileHandle& operator=(TFileHandle&& other);

    TFileHandle(const TFileHandle&) = delete;
    TFileHandle& operator=(const TFileHandle&) = delete;

    ~TFileHandle() {
        Close();
    }

    /**
     * @brief Reads up to @p size bytes, suspending until the descriptor is readable.
     *
     * Yields the number of bytes read, 0 on end of file, or a negative value
     * when the wake-up was spurious and the caller should read again.
     * @throws std::system_error on a read error.
     */
    auto ReadSome(void* buf, size_t size) {
        struct TAwaitableRead {
            bool await_ready() {
                SafeRun();
                return (ready = (ret >= 0));
            }

            void await_suspend(std::coroutine_handle<> h) {
                poller->AddRead(fd, h);
            }

            ssize_t await_resume() {
                if (!ready) {
                    SafeRun();
                }
                return ret;
            }

            void SafeRun() {
                ret = ::read(fd, b, s);
                if (ret < 0 && !(errno == EINTR || errno == EAGAIN)) {
                    throw std::system_error(errno, std::generic_category(), "read");
                }
            }

            TPollerBase* poller = nullptr;
            int fd = -1;
            void* b = nullptr;
            size_t s = 0;
            ssize_t ret = -1;
            bool ready = false;
        };
        return TAwaitableRead{Poller_, Fd_, buf, size};
    }

    void Close();

    int Fd() const {
        return Fd_;
    }

private:
    TPollerBase* Poller_ = nullptr;
    int Fd_ = -1;
};

/**
 * @brief Splits the byte stream of a TFileHandle into lines.
 *
 * Read() yields the next line without its terminator, the unterminated tail
 * at end of file, or std::nullopt once the input is exhausted. A line longer
 * than @p maxLineSize is skipped up to its terminator and reported as a
 * single TParseError; reading can go on after it.
 */
class TLineReader {
public:
    explicit TLineReader(TFileHandle& handle, size_t maxLineSize = 4096)
        : Handle_(handle)
        , MaxLineSize_(maxLineSize)
        , ChunkSize_(maxLineSize / 2)
    { }

    TFuture<std::optional<std::string>> Read();

private:
    std::optional<std::string> PopLine();
    [[noreturn]] void ThrowTooLong();

    TFileHandle& Handle_;
    size_t MaxLineSize_;
    size_t ChunkSize_;
    std::string Buffer_;
    bool Eof_ = false;
    bool Discarding_ = false;
};

} // namespace NRelay
