#include "file.hpp"

#include <fcntl.h>

#include <utility>

#include "errors.hpp"

namespace NRelay {

namespace {

int SetNonBlocking(int fd) {
    auto flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl");
    }
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl");
    }
    return fd;
}

} // namespace

TFileHandle::TFileHandle(int fd, TPollerBase& poller)
    : Poller_(&poller)
    , Fd_(SetNonBlocking(fd))
{ }

TFileHandle::TFileHandle(TFileHandle&& other)
{
    *this = std::move(other);
}

TFileHandle& TFileHandle::operator=(TFileHandle&& other) {
    if (this != &other) {
        Close();
        Poller_ = other.Poller_;
        Fd_ = std::exchange(other.Fd_, -1);
    }
    return *this;
}

void TFileHandle::Close() {
    if (Fd_ >= 0) {
        Poller_->RemoveEvent(Fd_);
        ::close(Fd_);
        Fd_ = -1;
    }
}

void TLineReader::ThrowTooLong() {
    throw TParseError("line is longer than " + std::to_string(MaxLineSize_) + " bytes");
}

std::optional<std::string> TLineReader::PopLine() {
    auto pos = Buffer_.find('\n');
    if (Discarding_) {
        if (pos == std::string::npos) {
            Buffer_.clear();
            return std::nullopt;
        }
        Buffer_.erase(0, pos + 1);
        Discarding_ = false;
        ThrowTooLong();
    }
    if (pos == std::string::npos) {
        if (Buffer_.size() > MaxLineSize_) {
            Discarding_ = true;
            Buffer_.clear();
        }
        return std::nullopt;
    }
    if (pos > MaxLineSize_) {
        Buffer_.erase(0, pos + 1);
        ThrowTooLong();
    }
    auto line = Buffer_.substr(0, pos);
    Buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

TFuture<std::optional<std::string>> TLineReader::Read() {
    auto line = PopLine();
    while (!line && !Eof_) {
        auto offset = Buffer_.size();
        Buffer_.resize(offset + ChunkSize_);
        auto size = co_await Handle_.ReadSome(Buffer_.data() + offset, ChunkSize_);
        Buffer_.resize(offset + (size > 0 ? size : 0));
        if (size < 0) {
            continue;
        }
        if (size == 0) {
            Eof_ = true;
            break;
        }
        line = PopLine();
    }
    if (!line && Discarding_) {
        Discarding_ = false;
        ThrowTooLong();
    }
    if (!line && Eof_ && !Buffer_.empty()) {
        line = std::exchange(Buffer_, {});
    }
    co_return line;
}

} // namespace NRelay
