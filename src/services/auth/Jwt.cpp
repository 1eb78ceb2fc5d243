#include "Jwt.hpp"

#include <memory>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "core/Errors.hpp"

using nlohmann::json;

namespace nb {

static std::string openssl_error() {
  const unsigned long code = ERR_get_error();
  if (code == 0) return "unknown OpenSSL error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

std::string base64url(std::string_view in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(in.data()),
                                static_cast<int>(in.size()));
  out.resize(static_cast<size_t>(n));
  for (char& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

std::string sign_rs256(const std::string& privateKeyPem, std::string_view data) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(
    BIO_new_mem_buf(privateKeyPem.data(), static_cast<int>(privateKeyPem.size())), &BIO_free);
  if (!bio) throw ConfigError("service account private key: " + openssl_error());

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
    PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
  if (!key) throw ConfigError("service account private key: " + openssl_error());

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx
      || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1
      || EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw ConfigError("sign JWT: " + openssl_error());
  }

  size_t len = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &len) != 1) throw ConfigError("sign JWT: " + openssl_error());
  std::string sig(len, '\0');
  if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()), &len) != 1) {
    throw ConfigError("sign JWT: " + openssl_error());
  }
  sig.resize(len);
  return sig;
}

std::string make_service_account_assertion(const std::string& clientEmail,
                                           const std::string& privateKeyPem,
                                           const std::string& scope,
                                           const std::string& audience,
                                           std::chrono::system_clock::time_point issuedAt) {
  const auto iat = std::chrono::duration_cast<std::chrono::seconds>(issuedAt.time_since_epoch()).count();
  const json header = {{"alg", "RS256"}, {"typ", "JWT"}};
  const json claims = {
    {"iss", clientEmail},
    {"scope", scope},
    {"aud", audience},
    {"iat", iat},
    {"exp", iat + 3600},
  };
  const std::string signingInput = base64url(header.dump()) + "." + base64url(claims.dump());
  return signingInput + "." + base64url(sign_rs256(privateKeyPem, signingInput));
}

} // namespace nb
