#pragma once

#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <string_view>

#include <servherd/core/types.h>

namespace servherd::naming {

/**
 * Adjective-noun name source over a seeded engine.
 * Two generators with the same seed yield the same sequence.
 */
class NameGenerator {
public:
    explicit NameGenerator(std::uint64_t seed) : engine_(seed) {}

    std::string next();

private:
    std::mt19937_64 engine_;
};

/**
 * Random adjective-noun name not in `existing`. After `maxAttempts` collisions a short
 * time-based suffix is appended instead of failing.
 */
std::string generateName(const std::set<std::string>& existing = {}, int maxAttempts = 100);

/// Pure function seed -> name
std::string nameFromSeed(std::uint64_t seed);

/**
 * Stable name for (command, env): SHA-256 over the command and the sorted KEY=VALUE lines,
 * whose first 64 bits seed a fresh NameGenerator.
 */
std::string generateDeterministicName(std::string_view command, const EnvMap& env = {});

} // namespace servherd::naming
