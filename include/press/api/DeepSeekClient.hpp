#pragma once
#include <string>
#include "press/api/CompletionService.hpp"

namespace press {

struct ClientSettings {
    std::string api_key;
    std::string base_url = "https://api.deepseek.com";
    std::string model = "deepseek-chat";
    float temperature = 0.0f;
    unsigned max_tokens = 8192;
};

// DeepSeek chat completions over HTTPS.
class DeepSeekClient : public CompletionService {
public:
    explicit DeepSeekClient(ClientSettings settings);

    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;

    // Body sent to /chat/completions.
    std::string build_request_body(const std::string& system_prompt, const std::string& user_prompt) const;

    // Pulls choices[0].message.content out of a response body.
    static std::string parse_completion(const std::string& body);

private:
    ClientSettings settings_;
};

} // namespace press
