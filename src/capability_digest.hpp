#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace switchboard {

// Precomputed search view of one tool. Built once per catalog rebuild.
struct DigestEntry {
    std::string name;
    std::string description;
    nlohmann::json schema;
    std::string server_id;
    std::vector<std::string> tags;  // lowercase, deduplicated

    std::string name_lc;
    std::string description_lc;
    std::string schema_lc;

    static DigestEntry make(const std::string& name, const std::string& description,
                            const nlohmann::json& schema, const std::string& server_id,
                            const std::vector<std::string>& tags);
};

struct ScoredTool {
    DigestEntry entry;
    double score = 0.0;
};

// context -> ranked tools; always contains the "all" bucket.
using CapabilityDigest = std::map<std::string, std::vector<ScoredTool>>;

constexpr double kTagMatchScore = 10.0;
constexpr double kNameMatchScore = 4.0;
constexpr double kDescriptionMatchScore = 2.0;
constexpr double kSchemaMatchScore = 1.0;

// Additive relevance of one entry for a lowercase context. Empty and "all"
// contexts give every entry a baseline of 1 + 0.1 per tag.
double score_entry(const DigestEntry& entry, const std::string& context);

// Entries with a positive score, by score desc then name asc; limit 0 keeps all.
std::vector<ScoredTool> rank_for_context(const std::vector<DigestEntry>& entries,
                                         const std::string& context, size_t limit);

CapabilityDigest build_capability_digest(const std::vector<DigestEntry>& entries,
                                         const std::vector<std::string>& contexts,
                                         size_t limit);

nlohmann::json digest_to_json(const CapabilityDigest& digest);

// "a*, b" with required parameters starred; "none" when there are none.
std::string summarize_tool_parameters(const nlohmann::json& parameters);

// System message text listing the digest's tools for the given contexts,
// or an empty string when nothing matches.
std::string build_tool_digest_message(const CapabilityDigest& digest,
                                      const std::vector<std::string>& contexts);

std::vector<std::string> normalize_contexts(const std::vector<std::string>& contexts);

} // namespace switchboard
