#include "TokenProvider.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

using nlohmann::json;

namespace nb {

std::optional<FederationContext> read_federation_context(const EnvLookup& env) {
  auto pool  = env("WORKLOAD_IDENTITY_POOL");
  auto url   = env("ACTIONS_ID_TOKEN_REQUEST_URL");
  auto token = env("ACTIONS_ID_TOKEN_REQUEST_TOKEN");
  if (!pool || pool->empty() || !url || url->empty() || !token || token->empty()) {
    return std::nullopt;
  }
  return FederationContext{*pool, *url, *token};
}

std::string strip_bearer_prefix(const std::string& token) {
  static const std::string prefix = "Bearer ";
  if (token.compare(0, prefix.size(), prefix) == 0) return token.substr(prefix.size());
  return token;
}

std::string token_field(const std::string& endpoint, const HttpResponse& res, const char* field) {
  if (!res.ok()) {
    throw TransportError(endpoint, res.status, res.body, "unexpected HTTP status");
  }
  json j;
  try {
    j = json::parse(res.body);
  } catch (const json::parse_error&) {
    throw TransportError(endpoint, res.status, res.body, "cannot decode token response");
  }
  if (!j.is_object() || !j.contains(field) || !j[field].is_string()) {
    throw TransportError(endpoint, res.status, res.body,
                         std::string("token response has no '") + field + "' field");
  }
  return j[field].get<std::string>();
}

std::string fetch_oidc_id_token(HttpClient& http, const FederationContext& ctx) {
  spdlog::debug("Requesting OIDC identity token from CI provider");
  const std::string url = append_query(ctx.oidcTokenUrl, "audience",
                                       "https://iam.googleapis.com/" + ctx.identityPool);
  const auto res = http.get(url, {{"Authorization", "Bearer " + ctx.oidcBearerToken}});
  return token_field(ctx.oidcTokenUrl, res, "value");
}

std::string exchange_federated_token(HttpClient& http,
                                     const std::string& identityPool,
                                     const std::string& idToken) {
  spdlog::debug("Exchanging federated identity token for an oauth2 token");
  const json request = {
    {"grantType", "urn:ietf:params:oauth:grant-type:token-exchange"},
    {"audience", "//iam.googleapis.com/" + identityPool},
    {"scope", kCloudPlatformScope},
    {"requestedTokenType", "urn:ietf:params:oauth:token-type:access_token"},
    {"subjectToken", idToken},
    {"subjectTokenType", "urn:ietf:params:oauth:token-type:jwt"},
  };
  const auto res = http.post(kTokenExchangeUrl, {}, request.dump(), "application/json");
  return token_field(kTokenExchangeUrl, res, "access_token");
}

std::string GoogleTokenProvider::acquireRegistryToken() {
  if (ctx_) {
    spdlog::info("Using workload identity federation ({})", ctx_->identityPool);
    const std::string idToken = fetch_oidc_id_token(http_, *ctx_);
    return exchange_federated_token(http_, ctx_->identityPool, idToken);
  }
  spdlog::info("Using application default credentials");
  return strip_bearer_prefix(ambient_.accessToken());
}

} // namespace nb
