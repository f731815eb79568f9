#include <servherd/common/env_compare.h>
#include <servherd/crypto/hasher.h>
#include <servherd/naming/name_generator.h>

#include <array>
#include <chrono>

namespace servherd::naming {

namespace {

constexpr std::array<const char*, 64> kAdjectives{
    "amber",   "ancient", "autumn",  "bold",    "brave",   "bright",  "calm",    "clever",
    "cosmic",  "crimson", "crisp",   "dapper",  "dark",    "dawn",    "eager",   "early",
    "fancy",   "fast",    "fierce",  "fluffy",  "frosty",  "gentle",  "giant",   "golden",
    "happy",   "hidden",  "humble",  "icy",     "jolly",   "keen",    "lively",  "lucky",
    "mellow",  "misty",   "modest",  "nimble",  "noble",   "odd",     "patient", "plain",
    "polite",  "proud",   "quiet",   "rapid",   "rustic",  "shiny",   "silent",  "silver",
    "sleepy",  "smooth",  "snowy",   "solar",   "spry",    "steady",  "stormy",  "sunny",
    "swift",   "tidy",    "vast",    "velvet",  "vivid",   "wandering", "wild",  "witty"};

constexpr std::array<const char*, 64> kNouns{
    "anchor",  "badger",  "beacon",  "bison",   "breeze",  "brook",   "canyon",  "cedar",
    "comet",   "coral",   "crane",   "creek",   "dolphin", "dune",    "eagle",   "ember",
    "falcon",  "fern",    "fjord",   "forest",  "fox",     "glacier", "grove",   "harbor",
    "hawk",    "heron",   "island",  "jaguar",  "lagoon",  "lark",    "lynx",    "maple",
    "meadow",  "mesa",    "moose",   "nebula",  "oak",     "orca",    "otter",   "owl",
    "panda",   "pebble",  "pine",    "planet",  "prairie", "quartz",  "raven",   "reef",
    "river",   "robin",   "sparrow", "spruce",  "summit",  "swan",    "thunder", "tiger",
    "tundra",  "valley",  "walrus",  "willow",  "wolf",    "wren",    "yak",     "zephyr"};

std::uint64_t timeSeed() {
    return static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
}

std::string base36(std::uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    do {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    } while (value > 0);
    return out;
}

} // namespace

// Indexes use the raw engine output so a seed maps to the same name on every standard library
std::string NameGenerator::next() {
    const auto a = engine_();
    const auto n = engine_();
    return std::string(kAdjectives[a % kAdjectives.size()]) + "-" + kNouns[n % kNouns.size()];
}

std::string generateName(const std::set<std::string>& existing, int maxAttempts) {
    std::random_device rd;
    NameGenerator gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd() ^ timeSeed());

    for (int i = 0; i < maxAttempts; ++i) {
        auto name = gen.next();
        if (existing.count(name) == 0) {
            return name;
        }
    }

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    auto suffix = base36(static_cast<std::uint64_t>(millis));
    if (suffix.size() > 4) {
        suffix = suffix.substr(suffix.size() - 4);
    }
    return gen.next() + "-" + suffix;
}

std::string nameFromSeed(std::uint64_t seed) {
    NameGenerator gen(seed);
    return gen.next();
}

std::string generateDeterministicName(std::string_view command, const EnvMap& env) {
    crypto::SHA256Hasher hasher;
    hasher.update(command);
    if (!env.empty()) {
        hasher.update(std::string_view("\n", 1));
        hasher.update(common::canonicalEnv(env));
    }
    const auto digest = hasher.finalize();
    const auto seed = std::stoull(digest.substr(0, 16), nullptr, 16);
    return nameFromSeed(seed);
}

} // namespace servherd::naming
