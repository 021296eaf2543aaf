#include "errors.hpp"

namespace NRelay {

TReplayError::TReplayError(size_t line, const std::string& reason)
    : TRelayError("event log line " + std::to_string(line) + ": " + reason)
    , Line_(line)
{ }

void RethrowWithContext(const std::string& context) {
    try {
        throw;
    } catch (const TUserError& ex) {
        throw TUserError(context + ": " + ex.what());
    } catch (const TTransportError& ex) {
        throw TTransportError(context + ": " + ex.what());
    } catch (const TRelayError& ex) {
        throw TRelayError(context + ": " + ex.what());
    }
}

} // namespace NRelay
