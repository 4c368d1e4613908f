#pragma once
#include <string>
#include <vector>

namespace switchboard {

int cmd_init();
int cmd_status();
int cmd_servers();
int cmd_discover();
int cmd_digest(const std::vector<std::string>& contexts, size_t limit);
int cmd_chat(const std::string& message, const std::string& session_id,
             const std::string& model, const std::vector<std::string>& contexts);
int cmd_call(const std::string& tool, const std::string& arguments);

} // namespace switchboard
