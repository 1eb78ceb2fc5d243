#pragma once
#include <optional>
#include <string>
#include <utility>

#include "core/Env.hpp"
#include "services/api/HttpClient.hpp"

namespace nb {

inline constexpr const char* kCloudPlatformScope = "https://www.googleapis.com/auth/cloud-platform";
inline constexpr const char* kTokenExchangeUrl   = "https://sts.googleapis.com/v1/token";

// CI identity signals. Present only when all three are set.
struct FederationContext {
  std::string identityPool;     // WORKLOAD_IDENTITY_POOL
  std::string oidcTokenUrl;     // ACTIONS_ID_TOKEN_REQUEST_URL
  std::string oidcBearerToken;  // ACTIONS_ID_TOKEN_REQUEST_TOKEN
};

std::optional<FederationContext> read_federation_context(const EnvLookup& env);

// "Bearer abc" -> "abc"; anything else is returned unchanged.
std::string strip_bearer_prefix(const std::string& token);

// Ask the CI OIDC endpoint for an identity token with audience
// https://iam.googleapis.com/{identityPool}.
std::string fetch_oidc_id_token(HttpClient& http, const FederationContext& ctx);

// OAuth 2.0 token exchange of the identity token for a Google access token.
std::string exchange_federated_token(HttpClient& http,
                                     const std::string& identityPool,
                                     const std::string& idToken);

// Reads one string field from a JSON token response. Non-2xx status, invalid
// JSON or a missing field all raise TransportError with status and raw body.
std::string token_field(const std::string& endpoint, const HttpResponse& res, const char* field);

class TokenProvider {
public:
  virtual ~TokenProvider() = default;
  virtual std::string acquireRegistryToken() = 0;
};

// Host credentials used when no federation context exists.
class CredentialSource {
public:
  virtual ~CredentialSource() = default;
  virtual std::string accessToken() = 0;
};

// Federated path when a FederationContext is present, otherwise the ambient
// credential source. Never retries; every failure is thrown to the caller.
class GoogleTokenProvider : public TokenProvider {
public:
  GoogleTokenProvider(std::optional<FederationContext> ctx, HttpClient& http, CredentialSource& ambient)
    : ctx_(std::move(ctx)), http_(http), ambient_(ambient) {}

  std::string acquireRegistryToken() override;

  bool federated() const { return ctx_.has_value(); }

private:
  const std::optional<FederationContext> ctx_;
  HttpClient& http_;
  CredentialSource& ambient_;
};

}
