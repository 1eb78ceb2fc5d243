#include "DefaultCredentials.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "Jwt.hpp"
#include "core/Errors.hpp"

using nlohmann::json;

namespace nb {

static std::string required_field(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
    throw ConfigError(std::string("credentials file: missing '") + key + "'");
  }
  return j[key].get<std::string>();
}

static std::string string_or(const json& j, const char* key, const std::string& def) {
  if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
    return j[key].get<std::string>();
  }
  return def;
}

std::optional<std::string> GoogleDefaultCredentials::credentialsFile() const {
  if (auto explicitPath = env_("GOOGLE_APPLICATION_CREDENTIALS"); explicitPath && !explicitPath->empty()) {
    return *explicitPath;
  }
  if (auto home = env_("HOME"); home && !home->empty()) {
    namespace fs = std::filesystem;
    const fs::path wellKnown = fs::path(*home) / ".config" / "gcloud" / "application_default_credentials.json";
    std::error_code ec;
    if (fs::is_regular_file(wellKnown, ec)) return wellKnown.string();
  }
  return std::nullopt;
}

std::string GoogleDefaultCredentials::tokenFromCredentials(const std::string& credentialsJson) {
  json j;
  try {
    j = json::parse(credentialsJson);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("credentials file: ") + e.what());
  }
  if (!j.is_object()) throw ConfigError("credentials file: not a JSON object");

  const std::string type = string_or(j, "type", "");
  const std::string tokenUri = string_or(j, "token_uri", kDefaultTokenAudience);

  if (type == "authorized_user") {
    spdlog::debug("Refreshing user credentials");
    const std::string body = form_encode({
      {"grant_type", "refresh_token"},
      {"client_id", required_field(j, "client_id")},
      {"client_secret", required_field(j, "client_secret")},
      {"refresh_token", required_field(j, "refresh_token")},
    });
    const auto res = http_.post(tokenUri, {}, body, "application/x-www-form-urlencoded");
    return token_field(tokenUri, res, "access_token");
  }

  if (type == "service_account") {
    spdlog::debug("Exchanging service account key for an oauth2 token");
    const std::string assertion = make_service_account_assertion(
      required_field(j, "client_email"), required_field(j, "private_key"),
      kCloudPlatformScope, kDefaultTokenAudience, now_());
    const std::string body = form_encode({
      {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
      {"assertion", assertion},
    });
    const auto res = http_.post(tokenUri, {}, body, "application/x-www-form-urlencoded");
    return token_field(tokenUri, res, "access_token");
  }

  throw ConfigError("credentials file: unsupported credential type '" + type + "'");
}

std::string GoogleDefaultCredentials::tokenFromMetadataServer() {
  spdlog::debug("Requesting token for the attached service account");
  const std::string url = append_query(kMetadataTokenUrl, "scopes", kCloudPlatformScope);
  const auto res = http_.get(url, {{"Metadata-Flavor", "Google"}});
  return token_field(kMetadataTokenUrl, res, "access_token");
}

std::string GoogleDefaultCredentials::accessToken() {
  if (auto path = credentialsFile()) {
    spdlog::debug("Using credentials file {}", *path);
    std::ifstream in(*path);
    if (!in) throw ConfigError("cannot open credentials file: " + *path);
    std::ostringstream buf; buf << in.rdbuf();
    return tokenFromCredentials(buf.str());
  }
  return tokenFromMetadataServer();
}

} // namespace nb
