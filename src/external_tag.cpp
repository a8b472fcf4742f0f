#include "external_tag.hpp"

#include <cstring>

// ─────────────────────────────────────
std::string FormatExternalTag(const std::string &externalId) {
    return std::string(kExternalTagPrefix) + externalId + "]";
}

// ─────────────────────────────────────
std::string BuildExternalDescription(const std::string &externalId,
                                     const std::string &remoteDescription) {
    if (remoteDescription.empty()) {
        return FormatExternalTag(externalId);
    }
    return FormatExternalTag(externalId) + " " + remoteDescription;
}

// ─────────────────────────────────────
std::optional<std::string> ParseExternalTag(const std::string &description) {
    const size_t start = description.find(kExternalTagPrefix);
    if (start == std::string::npos) {
        return std::nullopt;
    }

    const size_t idStart = start + std::strlen(kExternalTagPrefix);
    const size_t end = description.find(']', idStart);
    if (end == std::string::npos || end == idStart) {
        return std::nullopt;
    }

    std::string id = description.substr(idStart, end - idStart);
    if (id.find_first_of("[ \t\r\n") != std::string::npos) {
        return std::nullopt;
    }
    return id;
}

// ─────────────────────────────────────
bool IsLinkableExternalId(const std::string &externalId) {
    if (externalId.empty()) {
        return false;
    }
    std::optional<std::string> parsed = ParseExternalTag(FormatExternalTag(externalId));
    return parsed && *parsed == externalId;
}
