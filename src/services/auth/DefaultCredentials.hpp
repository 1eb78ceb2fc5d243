#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "TokenProvider.hpp"

namespace nb {

inline constexpr const char* kDefaultTokenAudience = "https://oauth2.googleapis.com/token";
inline constexpr const char* kMetadataTokenUrl =
  "http://metadata.google.internal/computeMetadata/v1/instance/service-accounts/default/token";

// Google application default credentials, resolved in this order:
//  1. the file named by GOOGLE_APPLICATION_CREDENTIALS
//  2. $HOME/.config/gcloud/application_default_credentials.json
//  3. the attached service account via the metadata server
// Credential files of type authorized_user and service_account are supported.
class GoogleDefaultCredentials : public CredentialSource {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  GoogleDefaultCredentials(HttpClient& http, EnvLookup env,
                           Clock now = [] { return std::chrono::system_clock::now(); })
    : http_(http), env_(std::move(env)), now_(std::move(now)) {}

  std::string accessToken() override;

  // Path of the credentials file to use, if any.
  std::optional<std::string> credentialsFile() const;

  // Token from the content of a credentials file.
  std::string tokenFromCredentials(const std::string& credentialsJson);

  std::string tokenFromMetadataServer();

private:
  HttpClient& http_;
  EnvLookup env_;
  Clock now_;
};

}
