#pragma once

#include "data.hpp"

namespace NRelay {

/// Source of fresh "#..." thread ids.
class IThreadIdGenerator {
public:
    virtual ~IThreadIdGenerator() = default;
    virtual TThreadId Generate() = 0;
};

/**
 * @brief Mints "#adjective_noun" ids from OpenSSL's random generator.
 *
 * Ids are picked with RAND_bytes so other users cannot guess the next one.
 * @throws TRelayError if the generator fails; the command that needed the id fails with it.
 */
class TRandomThreadIdGenerator: public IThreadIdGenerator {
public:
    TThreadId Generate() override;
};

} // namespace NRelay
