#pragma once
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>

namespace nb {

// Reads one environment variable. Injected where tests need a fixed environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

inline std::optional<std::string> process_env(const std::string& key) {
  if (const char* v = std::getenv(key.c_str())) return std::string(v);
  return std::nullopt;
}

inline std::string get_env_or(const EnvLookup& env, const std::string& key, const std::string& defval) {
  if (auto v = env(key); v && !v->empty()) return *v;
  return defval;
}

inline std::string get_env_or(const char* key, const std::string& defval) {
  return get_env_or(EnvLookup(process_env), key, defval);
}

} // namespace nb
