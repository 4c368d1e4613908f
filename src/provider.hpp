#pragma once
#include "config.hpp"
#include "sse.hpp"
#include <httplib.h>
#include <string>
#include <map>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace switchboard {

// Model gateway failure. Transport failures carry status 502.
struct ProviderError : std::runtime_error {
    ProviderError(int status, nlohmann::json detail_)
        : std::runtime_error(describe(status, detail_)), status_code(status), detail(std::move(detail_)) {}

    int status_code;
    nlohmann::json detail;

private:
    static std::string describe(int status, const nlohmann::json& detail) {
        std::string text = detail.is_string() ? detail.get<std::string>() : detail.dump();
        return "Provider error " + std::to_string(status) + ": " + text;
    }
};

using ProviderEventHandler = std::function<void(const SseEvent&)>;

// Streams one chat completion as SSE events. Implementations deliver raw
// `message` events (including the final "[DONE]") in arrival order and throw
// ProviderError on failure.
class ModelGateway {
public:
    virtual ~ModelGateway() = default;
    virtual void stream_chat(const nlohmann::json& payload, const ProviderEventHandler& on_event) = 0;
};

// OpenAI-compatible /chat/completions over HTTP(S).
class HttpModelGateway : public ModelGateway {
public:
    explicit HttpModelGateway(const ProviderConfig& cfg);

    void stream_chat(const nlohmann::json& payload, const ProviderEventHandler& on_event) override;

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    // Cached URL components (parsed once in constructor)
    std::string base_url_;  // scheme://host:port
    std::string path_prefix_;
};

// openrouter-* plus x-request-id and via, keyed as received.
std::map<std::string, std::string> extract_routing_headers(const httplib::Headers& headers);

// Error body as JSON: the "error" member of an object, the parsed value, or
// the raw text.
nlohmann::json extract_error_detail(const std::string& body);

} // namespace switchboard
