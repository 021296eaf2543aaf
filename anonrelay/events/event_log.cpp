#include "event_log.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <anonrelay/errors.hpp>

namespace NRelay {
namespace NEvents {

std::optional<TEvent> TEventLogReader::Next() {
    std::string line;
    while (std::getline(Input_, line)) {
        ++Line_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            return Deserialize(line);
        } catch (const std::invalid_argument& ex) {
            throw TReplayError(Line_, ex.what());
        }
    }
    if (Input_.bad()) {
        throw TReplayError(Line_ + 1, "read failed");
    }
    return std::nullopt;
}

TFileEventWriter::TFileEventWriter(const std::string& path, bool sync)
    : Fd_(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644))
    , Sync_(sync)
{
    if (Fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }
}

TFileEventWriter::~TFileEventWriter() {
    if (Fd_ >= 0) {
        ::close(Fd_);
    }
}

void TFileEventWriter::Write(const std::vector<TEvent>& events) {
    std::string buffer;
    for (const auto& event : events) {
        buffer += Serialize(event);
        buffer += '\n';
    }

    auto start = ::lseek(Fd_, 0, SEEK_END);
    if (start < 0) {
        throw std::system_error(errno, std::generic_category(), "lseek");
    }

    const char* data = buffer.data();
    size_t left = buffer.size();
    while (left > 0) {
        auto written = ::write(Fd_, data, left);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            Rollback(start, "write");
        }
        data += written;
        left -= written;
    }

    if (Sync_ && ::fdatasync(Fd_) < 0) {
        Rollback(start, "fdatasync");
    }
}

void TFileEventWriter::Rollback(off_t size, const char* what) {
    auto error = errno;
    if (::ftruncate(Fd_, size) < 0) {
        throw std::system_error(errno, std::generic_category(),
            std::string(what) + " failed, cannot truncate the log back");
    }
    throw std::system_error(error, std::generic_category(), what);
}

} // namespace NEvents
} // namespace NRelay
