#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "event.hpp"

namespace NRelay {
namespace NEvents {

/**
 * @brief Forward-only reader of a newline-delimited event log.
 *
 * Events are decoded lazily, one line per Next() call. Blank lines are
 * skipped. A line that does not decode throws TReplayError carrying its
 * 1-based number; the reader must not be used after that.
 */
class TEventLogReader {
public:
    explicit TEventLogReader(std::istream& input)
        : Input_(input)
    { }

    /// Next event, or std::nullopt at end of input.
    std::optional<TEvent> Next();

    size_t LineNumber() const {
        return Line_;
    }

private:
    std::istream& Input_;
    size_t Line_ = 0;
};

/// Sink of serialized events. Write() returns once the whole batch is stored.
class IEventWriter {
public:
    virtual ~IEventWriter() = default;
    /// @throws std::exception if the batch could not be stored.
    virtual void Write(const std::vector<TEvent>& events) = 0;
};

/**
 * @brief Appends events to a file, one JSON object per line.
 *
 * The file is opened with O_APPEND and created if missing. Each batch goes
 * out in a single buffer; with @p sync the data is also fdatasync'ed before
 * Write() returns. A batch that fails is cut off again, so the file never
 * keeps a partial line.
 */
class TFileEventWriter: public IEventWriter {
public:
    TFileEventWriter(const std::string& path, bool sync);
    ~TFileEventWriter();

    TFileEventWriter(const TFileEventWriter&) = delete;
    TFileEventWriter& operator=(const TFileEventWriter&) = delete;

    void Write(const std::vector<TEvent>& events) override;

private:
    /// Cuts the file back to @p size and throws for the failed call @p what.
    [[noreturn]] void Rollback(off_t size, const char* what);

    int Fd_ = -1;
    bool Sync_;
};

} // namespace NEvents
} // namespace NRelay
