#include "capability_digest.hpp"
#include "utils.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace switchboard {

DigestEntry DigestEntry::make(const std::string& name, const std::string& description,
                              const nlohmann::json& schema, const std::string& server_id,
                              const std::vector<std::string>& tags) {
    DigestEntry e;
    e.name = name;
    e.description = description;
    e.schema = schema;
    e.server_id = server_id;
    for (auto& t : tags) {
        std::string tag = to_lower(trim(t));
        if (!tag.empty() && std::find(e.tags.begin(), e.tags.end(), tag) == e.tags.end()) {
            e.tags.push_back(tag);
        }
    }
    e.name_lc = to_lower(name);
    e.description_lc = to_lower(description);
    e.schema_lc = schema.is_null() ? "" : to_lower(schema.dump());
    return e;
}

double score_entry(const DigestEntry& entry, const std::string& context) {
    if (context.empty() || context == "all") {
        return 1.0 + 0.1 * static_cast<double>(entry.tags.size());
    }
    double score = 0.0;
    if (std::find(entry.tags.begin(), entry.tags.end(), context) != entry.tags.end()) {
        score += kTagMatchScore;
    }
    if (entry.name_lc.find(context) != std::string::npos) score += kNameMatchScore;
    if (entry.description_lc.find(context) != std::string::npos) score += kDescriptionMatchScore;
    if (entry.schema_lc.find(context) != std::string::npos) score += kSchemaMatchScore;
    return score;
}

std::vector<ScoredTool> rank_for_context(const std::vector<DigestEntry>& entries,
                                         const std::string& context, size_t limit) {
    std::vector<ScoredTool> ranked;
    for (auto& e : entries) {
        double s = score_entry(e, context);
        if (s > 0.0) ranked.push_back({e, s});
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoredTool& a, const ScoredTool& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.entry.name < b.entry.name;
    });
    if (limit > 0 && ranked.size() > limit) ranked.resize(limit);
    return ranked;
}

std::vector<std::string> normalize_contexts(const std::vector<std::string>& contexts) {
    std::vector<std::string> out;
    for (auto& c : contexts) {
        std::string n = to_lower(trim(c));
        if (!n.empty() && std::find(out.begin(), out.end(), n) == out.end()) out.push_back(n);
    }
    return out;
}

CapabilityDigest build_capability_digest(const std::vector<DigestEntry>& entries,
                                         const std::vector<std::string>& contexts,
                                         size_t limit) {
    CapabilityDigest digest;
    for (auto& ctx : normalize_contexts(contexts)) {
        digest[ctx] = rank_for_context(entries, ctx, limit);
    }
    if (!digest.count("all")) {
        digest["all"] = rank_for_context(entries, "all", limit);
    }
    return digest;
}

nlohmann::json digest_to_json(const CapabilityDigest& digest) {
    nlohmann::json out = nlohmann::json::object();
    for (auto& [ctx, tools] : digest) {
        nlohmann::json arr = nlohmann::json::array();
        for (auto& t : tools) {
            nlohmann::json item = {
                {"name", t.entry.name},
                {"server", t.entry.server_id},
                {"score", t.score},
                {"contexts", t.entry.tags},
            };
            if (!t.entry.description.empty()) item["description"] = t.entry.description;
            if (t.entry.schema.is_object() && !t.entry.schema.empty()) item["parameters"] = t.entry.schema;
            arr.push_back(std::move(item));
        }
        out[ctx] = std::move(arr);
    }
    return out;
}

std::string summarize_tool_parameters(const nlohmann::json& parameters) {
    if (!parameters.is_object()) return "none";

    std::set<std::string> required;
    if (parameters.contains("required") && parameters["required"].is_array()) {
        for (auto& r : parameters["required"]) {
            if (r.is_string() && !trim(r.get<std::string>()).empty()) required.insert(trim(r.get<std::string>()));
        }
    }

    std::vector<std::string> names;
    if (parameters.contains("properties") && parameters["properties"].is_object()) {
        for (auto& [key, _] : parameters["properties"].items()) {
            std::string n = trim(key);
            if (n.empty()) continue;
            if (required.erase(n)) names.push_back(n + "*");
            else names.push_back(n);
        }
    }
    if (names.empty()) {
        for (auto& r : required) names.push_back(r + "*");
    }
    return names.empty() ? "none" : join(names, ", ");
}

static std::string collapse_whitespace(const std::string& s) {
    std::istringstream in(s);
    std::string word, out;
    while (in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::string build_tool_digest_message(const CapabilityDigest& digest,
                                      const std::vector<std::string>& contexts) {
    std::vector<std::string> ordered;
    for (auto& ctx : normalize_contexts(contexts)) {
        if (ctx != "all" && digest.count(ctx) && !digest.at(ctx).empty()) ordered.push_back(ctx);
    }
    if (ordered.empty()) return "";

    std::set<std::string> seen;
    std::vector<std::string> lines;
    for (auto& ctx : ordered) {
        for (auto& t : digest.at(ctx)) {
            if (!seen.insert(t.entry.name).second) continue;
            std::string desc = collapse_whitespace(t.entry.description);
            if (desc.empty()) {
                desc = t.entry.server_id.empty() ? "No description provided"
                                                 : "Provided by " + t.entry.server_id + " server";
            }
            lines.push_back("- " + t.entry.name + " — " + desc +
                            " (params: " + summarize_tool_parameters(t.entry.schema) + ")");
        }
    }
    return "Tool digest for contexts: " + join(ordered, ", ") + "\n" + join(lines, "\n");
}

} // namespace switchboard
