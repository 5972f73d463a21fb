#include "press/api/DeepSeekClient.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace press {

using json = nlohmann::json;

DeepSeekClient::DeepSeekClient(ClientSettings settings) : settings_(std::move(settings)) {}

std::string DeepSeekClient::build_request_body(const std::string& system_prompt,
                                               const std::string& user_prompt) const {
    json payload = {
        {"model", settings_.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        })},
        {"temperature", settings_.temperature},
        {"max_tokens", settings_.max_tokens}
    };
    return payload.dump();
}

std::string DeepSeekClient::parse_completion(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw JsonError(e.what());
    }

    if (j.contains("error")) throw ApiError(j["error"].dump());

    try {
        const auto& content = j.at("choices").at(0).at("message").at("content");
        if (!content.is_string()) return "(No response)";
        return content.get<std::string>();
    } catch (const json::exception& e) {
        throw JsonError(std::string("unexpected response shape: ") + e.what());
    }
}

std::string DeepSeekClient::complete(const std::string& system_prompt, const std::string& user_prompt) {
    std::string url = settings_.base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/chat/completions";

    spdlog::debug("POST {} ({} prompt bytes)", url, user_prompt.size());
    auto r = cpr::Post(cpr::Url{url},
                       cpr::Bearer{settings_.api_key},
                       cpr::Body{build_request_body(system_prompt, user_prompt)},
                       cpr::Header{{"Content-Type", "application/json"}});

    if (r.error) throw RequestError(r.error.message);
    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::error("API Error [{}]: {}", r.status_code, r.text);
        throw ApiError("status " + std::to_string(r.status_code) + ": " + r.text);
    }

    auto content = parse_completion(r.text);
    spdlog::info("Completion received ({} bytes)", content.size());
    return content;
}

} // namespace press
