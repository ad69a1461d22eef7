#pragma once

#include <optional>
#include <string>

namespace sandpool::sandbox {

enum class Sanitizer {
    kAddress,
    kCoverage
};

inline const char* ToString(Sanitizer sanitizer) {
    switch (sanitizer) {
        case Sanitizer::kAddress: return "address";
        case Sanitizer::kCoverage: return "coverage";
    }
    return "unknown";
}

inline std::optional<Sanitizer> ParseSanitizer(const std::string& value) {
    if (value == "address") {
        return Sanitizer::kAddress;
    }
    if (value == "coverage") {
        return Sanitizer::kCoverage;
    }
    return std::nullopt;
}

}  // namespace sandpool::sandbox
