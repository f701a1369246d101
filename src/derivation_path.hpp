#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "consts.hpp"
#include "result.hpp"

namespace hdwif {

// One path component. index is always below 2^31; hardening is kept as a flag.
struct DerivationStep {
    uint32_t index;
    bool hardened;

    uint32_t child_number() const { return hardened ? index + HARDENED_OFFSET : index; }

    bool operator==(const DerivationStep&) const = default;
};

using DerivationPath = std::vector<DerivationStep>;

// Parses BIP32 path strings such as "m/84h/1h/0h/0/0".
//
// Path format:
// - optional "m/" prefix for the master key; a bare "m" is not a path
// - "/" separates components; empty components are skipped
// - each component is a decimal index below 2^31
// - a trailing ' or h marks hardened derivation (index + 0x80000000)
class PathParser {
public:
    static Result<DerivationPath> parse(const std::string& path);

    // Parses a single component such as "84h" or "0"
    static Result<DerivationStep> parse_step(const std::string& segment);
};

// Renders a path as "m/84h/1h/0h/0/0"
std::string to_string(const DerivationPath& path);

} // namespace hdwif
