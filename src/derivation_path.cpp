#include "derivation_path.hpp"
#include "error.hpp"
#include <algorithm>
#include <sstream>

namespace hdwif {

Result<DerivationStep> PathParser::parse_step(const std::string& segment) {
    std::string index_str = segment;
    bool hardened = index_str.ends_with('\'') || index_str.ends_with('h');
    if (hardened) {
        index_str.pop_back();
    }

    if (index_str.empty() ||
        !std::all_of(index_str.begin(), index_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return PathError(DeriveError::ErrorType::InvalidPathSegment,
            "Invalid derivation path segment '" + segment + "'");
    }

    // Accumulate in 64 bits and stop as soon as the value leaves the 31-bit range
    uint64_t index = 0;
    for (char c : index_str) {
        index = index * 10 + static_cast<uint64_t>(c - '0');
        if (index >= HARDENED_OFFSET) {
            return PathError(DeriveError::ErrorType::IndexOverflow,
                "Derivation index '" + segment + "' must be below 2147483648");
        }
    }

    return DerivationStep{static_cast<uint32_t>(index), hardened};
}

// Splits the path on '/' and parses every non-empty component in order.
// The returned order is the derivation order.
Result<DerivationPath> PathParser::parse(const std::string& derivation_path) {
    std::string path = derivation_path;
    if (path.starts_with("m/")) {
        path = path.substr(2);
    }

    DerivationPath steps;
    std::istringstream path_stream(path);
    std::string index_str;

    while (std::getline(path_stream, index_str, '/')) {
        if (index_str.empty()) {
            continue;
        }

        auto step = parse_step(index_str);
        if (!step) {
            return step.error();
        }
        steps.push_back(step.value());
    }

    return steps;
}

std::string to_string(const DerivationPath& path) {
    std::string result = "m";
    for (const auto& step : path) {
        result += "/" + std::to_string(step.index);
        if (step.hardened) {
            result += "h";
        }
    }
    return result;
}

} // namespace hdwif
