#pragma once
#include <cstdint>
#include <map>
#include <string>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int(const char* key, int def);
double getenv_double(const char* key, double def);

// Milliseconds since the Unix epoch (system clock).
std::int64_t now_ms();
std::string iso8601_utc(std::int64_t epoch_ms);

// Random RFC 4122 version 4 identifier.
std::string gen_uuid();

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// "a=1, b=2" -> {a:1, b:2}; keys are lowercased, empty pairs dropped.
std::map<std::string, std::string> parse_kv_list(const std::string& text);
