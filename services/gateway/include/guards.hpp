#pragma once
#include <string>
#include <vector>

// Environment variables that would hand the gateway model credentials.
const std::vector<std::string>& forbidden_llm_env_keys();

// Throws std::runtime_error naming the first forbidden variable that is set
// to a non-empty value.
void assert_no_llm_env();
