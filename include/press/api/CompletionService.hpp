#pragma once
#include <chrono>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include "press/errors.hpp"

namespace press {

// A chat completion backend: one system prompt, one user prompt, one reply.
class CompletionService {
public:
    virtual ~CompletionService() = default;

    // Throws RequestError, JsonError or ApiError.
    virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) = 0;
};

// Runs request() up to retries + 1 times, sleeping delay_ms between attempts.
// Only ApiFailure is retried; the last one is rethrown.
template<typename Func>
auto with_retries(Func request, unsigned retries, unsigned delay_ms) -> decltype(request()) {
    for (unsigned attempt = 0;; ++attempt) {
        try {
            return request();
        } catch (const ApiFailure& e) {
            if (attempt >= retries) {
                spdlog::error("Request failed after {} attempts: {}", attempt + 1, e.what());
                throw;
            }
            spdlog::warn("Request failed ({}). Retrying (Attempt {}/{})...", e.what(), attempt + 1, retries);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
}

} // namespace press
