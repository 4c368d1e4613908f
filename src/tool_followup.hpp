#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchboard {

// Phrase heuristic for "the tool ran but found nothing".
class NoResultClassifier {
public:
    NoResultClassifier();
    explicit NoResultClassifier(std::vector<std::string> phrases);

    bool matches(const std::string& text) const;
    const std::vector<std::string>& phrases() const { return phrases_; }

private:
    std::vector<std::string> phrases_;  // lowercase
};

enum class FollowupKind { none, missing_arguments, tool_error, no_results, empty_result };

const char* to_string(FollowupKind kind);

// status is "success" or "error".
FollowupKind classify_tool_followup(const std::string& status, const std::string& result_text,
                                    bool tool_error_flag, bool missing_arguments,
                                    const NoResultClassifier& classifier = NoResultClassifier());

// Provider 404s that mean "this model cannot use tools".
bool is_tool_support_error(int status, const nlohmann::json& detail);

// chat_history, *__chat_history and anything in extra.
bool tool_requires_session_id(const std::string& tool_name,
                              const std::vector<std::string>& extra = {});

} // namespace switchboard
