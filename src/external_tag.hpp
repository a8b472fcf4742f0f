#pragma once

#include <optional>
#include <string>

// A local task is linked to a remote one by a "[EXT-<id>]" marker inside its
// description. Only the first marker counts; a marker without a closing bracket
// or with an empty id means the task is untagged.
inline constexpr const char *kExternalTagPrefix = "[EXT-";

std::string FormatExternalTag(const std::string &externalId);

// Tag followed by the remote description, or the bare tag when that is empty.
std::string BuildExternalDescription(const std::string &externalId,
                                     const std::string &remoteDescription);

std::optional<std::string> ParseExternalTag(const std::string &description);

// True when the tag written for this id parses back to the same id. Empty ids
// and ids holding whitespace or brackets cannot be linked.
bool IsLinkableExternalId(const std::string &externalId);
