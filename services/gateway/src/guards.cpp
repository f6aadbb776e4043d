#include "guards.hpp"
#include <cstdlib>
#include <stdexcept>

const std::vector<std::string>& forbidden_llm_env_keys() {
    static const std::vector<std::string> keys = {
        "OPENAI_API_KEY",
        "ANTHROPIC_API_KEY",
        "GOOGLE_API_KEY",
        "MOONSHOT_API_KEY",
    };
    return keys;
}

void assert_no_llm_env() {
    for (const auto& key : forbidden_llm_env_keys()) {
        const char* v = std::getenv(key.c_str());
        if (v && *v) {
            throw std::runtime_error(key + " is present in NovaAgent gateway process. "
                                           "Gateway must not own LLM credentials.");
        }
    }
}
