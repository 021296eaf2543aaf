#include "names.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "errors.hpp"

namespace NRelay {

namespace {

constexpr std::array<std::string_view, 64> Adjectives = {
    "amber", "brave", "calm", "clever", "crimson", "curious", "dusty", "eager",
    "fancy", "gentle", "golden", "happy", "hidden", "humble", "icy", "jolly",
    "kind", "lazy", "lively", "lucky", "mellow", "misty", "noble", "proud",
    "quiet", "rapid", "shy", "silent", "silver", "sleepy", "swift", "witty",
    "agile", "bold", "bright", "busy", "cheerful", "cozy", "daring", "dreamy",
    "fierce", "fluffy", "frosty", "fuzzy", "giddy", "grumpy", "hasty", "hazy",
    "honest", "jumpy", "keen", "loyal", "merry", "modest", "nimble", "patient",
    "plucky", "polite", "rusty", "sandy", "snowy", "sunny", "tidy", "wise",
};

constexpr std::array<std::string_view, 64> Nouns = {
    "badger", "beaver", "bison", "camel", "cobra", "crane", "dolphin", "eagle",
    "falcon", "ferret", "gecko", "heron", "ibis", "jackal", "koala", "lemur",
    "lynx", "marmot", "moose", "narwhal", "otter", "owl", "panda", "parrot",
    "puffin", "raven", "salmon", "seal", "tapir", "walrus", "wombat", "yak",
    "alpaca", "antelope", "beetle", "bobcat", "buffalo", "cricket", "donkey", "finch",
    "gazelle", "gopher", "hamster", "hedgehog", "iguana", "kestrel", "lobster", "magpie",
    "meerkat", "mole", "newt", "ocelot", "octopus", "pelican", "penguin", "pigeon",
    "quail", "rabbit", "robin", "sparrow", "squirrel", "toucan", "turtle", "weasel",
};

uint32_t RandomIndex(uint32_t bound) {
    uint32_t value = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
        throw TRelayError("failed to pick a thread id: RAND_bytes error " + std::to_string(ERR_get_error()));
    }
    return value % bound;
}

} // namespace

TThreadId TRandomThreadIdGenerator::Generate() {
    auto adjective = Adjectives[RandomIndex(Adjectives.size())];
    auto noun = Nouns[RandomIndex(Nouns.size())];
    TThreadId id = "#";
    id += adjective;
    id += "_";
    id += noun;
    return id;
}

} // namespace NRelay
