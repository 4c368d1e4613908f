#include "provider.hpp"
#include "net_probe.hpp"
#include "utils.hpp"
#include <iostream>
#include <exception>

namespace switchboard {

HttpModelGateway::HttpModelGateway(const ProviderConfig& cfg) : config_(cfg) {
    HttpUrl u = parse_http_url(config_.api_base);
    base_url_ = u.base();
    path_prefix_ = u.path;
}

std::map<std::string, std::string> extract_routing_headers(const httplib::Headers& headers) {
    std::map<std::string, std::string> out;
    for (auto& [key, value] : headers) {
        std::string k = to_lower(key);
        if (starts_with(k, "openrouter-") || k == "x-request-id" || k == "via") {
            out[key] = value;
        }
    }
    return out;
}

nlohmann::json extract_error_detail(const std::string& body) {
    if (body.empty()) return "Provider returned an empty error response.";
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) return body;
    if (j.is_object() && j.contains("error") && !j["error"].is_null()) return j["error"];
    return j;
}

void HttpModelGateway::stream_chat(const nlohmann::json& payload, const ProviderEventHandler& on_event) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(config_.connect_timeout, 0);
    cli.set_read_timeout(config_.read_timeout, 0);

    std::string body = payload.dump();
    if (config_.log_payloads) {
        std::cerr << "[provider] POST " << path_prefix_ << "/chat/completions "
                  << truncate_preview(body, 2000) << "\n";
    }

    httplib::Request req;
    req.method = "POST";
    req.path = path_prefix_ + "/chat/completions";
    req.body = body;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    if (!config_.api_key.empty()) {
        req.set_header("Authorization", "Bearer " + config_.api_key);
    }
    if (!config_.app_url.empty()) {
        req.set_header("HTTP-Referer", config_.app_url);
        req.set_header("Referer", config_.app_url);
    }
    if (!config_.app_name.empty()) {
        req.set_header("X-Title", config_.app_name);
    }

    int status = 0;
    std::string error_body;
    std::exception_ptr handler_error;

    SseParser parser([&](const SseEvent& ev) { on_event(ev); });

    req.response_handler = [&](const httplib::Response& res) {
        status = res.status;
        if (status >= 400) return true;
        auto routing = extract_routing_headers(res.headers);
        if (routing.empty()) return true;
        nlohmann::json data(routing);
        try {
            on_event({"openrouter_headers", data.dump(), ""});
        } catch (...) {
            handler_error = std::current_exception();
            return false;
        }
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (status >= 400) {
            error_body.append(data, len);
            return true;
        }
        try {
            parser.feed(data, len);
        } catch (...) {
            // Re-thrown below once httplib has unwound.
            handler_error = std::current_exception();
            return false;
        }
        return true;
    };

    auto res = cli.send(req);
    if (handler_error) std::rethrow_exception(handler_error);
    if (status >= 400) {
        throw ProviderError(status, extract_error_detail(error_body));
    }
    if (!res) {
        std::string what = httplib::to_string(res.error());
        std::cerr << "[provider] Request to " << base_url_ << " failed: " << what << "\n";
        throw ProviderError(502, what);
    }
    parser.finish();
}

} // namespace switchboard
