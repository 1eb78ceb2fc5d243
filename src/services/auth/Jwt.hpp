#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace nb {

// base64url without padding (RFC 7515).
std::string base64url(std::string_view in);

// RSASSA-PKCS1-v1_5 SHA-256 signature of data with a PEM private key.
// Throws ConfigError if the key cannot be read or used.
std::string sign_rs256(const std::string& privateKeyPem, std::string_view data);

// Signed JWT for the OAuth 2.0 JWT bearer grant, valid for one hour from issuedAt.
std::string make_service_account_assertion(const std::string& clientEmail,
                                           const std::string& privateKeyPem,
                                           const std::string& scope,
                                           const std::string& audience,
                                           std::chrono::system_clock::time_point issuedAt);

}
