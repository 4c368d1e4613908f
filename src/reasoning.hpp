#pragma once
#include <string>
#include <vector>
#include <set>
#include <utility>
#include <nlohmann/json.hpp>

namespace switchboard {

// {"text": ..., "type": ...}; type is omitted when no label was found.
using ReasoningSegment = nlohmann::json;
using ReasoningKeySet = std::set<std::pair<std::string, std::string>>;

// Flattens whatever shape a provider uses for reasoning into labeled text
// segments. Objects are searched for text-bearing keys; an object without
// any is serialized minus its type/id/index.
std::vector<ReasoningSegment> extract_reasoning_segments(const nlohmann::json& payload);

// Appends trimmed, non-empty segments whose (type, text) has not been seen.
void extend_reasoning_segments(std::vector<ReasoningSegment>& accumulator,
                               const std::vector<ReasoningSegment>& segments,
                               ReasoningKeySet& seen);

} // namespace switchboard
