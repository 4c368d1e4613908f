#include "tool_followup.hpp"
#include "utils.hpp"
#include <algorithm>

namespace switchboard {

NoResultClassifier::NoResultClassifier()
    : phrases_{
          "not found", "no results", "no result", "could not find", "can't find",
          "cannot find", "wasn't found", "nothing found", "no matching", "no events found",
      } {}

NoResultClassifier::NoResultClassifier(std::vector<std::string> phrases) {
    for (auto& p : phrases) {
        std::string n = to_lower(trim(p));
        if (!n.empty()) phrases_.push_back(std::move(n));
    }
}

bool NoResultClassifier::matches(const std::string& text) const {
    std::string lowered = to_lower(trim(text));
    if (lowered.empty()) return false;
    return std::any_of(phrases_.begin(), phrases_.end(), [&](const std::string& p) {
        return lowered.find(p) != std::string::npos;
    });
}

const char* to_string(FollowupKind kind) {
    switch (kind) {
        case FollowupKind::missing_arguments: return "missing_arguments";
        case FollowupKind::tool_error: return "tool_error";
        case FollowupKind::no_results: return "no_results";
        case FollowupKind::empty_result: return "empty_result";
        case FollowupKind::none: break;
    }
    return "none";
}

FollowupKind classify_tool_followup(const std::string& status, const std::string& result_text,
                                    bool /*tool_error_flag*/, bool missing_arguments,
                                    const NoResultClassifier& classifier) {
    if (missing_arguments) return FollowupKind::missing_arguments;

    bool empty = trim(result_text).empty();
    if (status == "error") {
        if (classifier.matches(result_text)) return FollowupKind::no_results;
        return FollowupKind::tool_error;
    }
    if (empty) return FollowupKind::empty_result;
    if (classifier.matches(result_text)) return FollowupKind::no_results;
    return FollowupKind::none;
}

bool is_tool_support_error(int status, const nlohmann::json& detail) {
    if (status != 404) return false;
    std::string message;
    if (detail.is_object()) {
        for (auto& [_, value] : detail.items()) {
            if (!value.is_string()) continue;
            if (!message.empty()) message += ' ';
            message += value.get<std::string>();
        }
    } else if (detail.is_string()) {
        message = detail.get<std::string>();
    } else if (!detail.is_null()) {
        message = detail.dump();
    }
    message = to_lower(message);
    return message.find("tool") != std::string::npos &&
           message.find("support") != std::string::npos &&
           message.find("tool use") != std::string::npos;
}

bool tool_requires_session_id(const std::string& tool_name,
                              const std::vector<std::string>& extra) {
    if (tool_name == "chat_history" || ends_with(tool_name, "__chat_history")) return true;
    return std::find(extra.begin(), extra.end(), tool_name) != extra.end();
}

} // namespace switchboard
