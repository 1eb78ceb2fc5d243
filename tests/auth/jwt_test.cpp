#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "core/Errors.hpp"
#include "services/auth/Jwt.hpp"

namespace {

using PKey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

PKey generate_key() {
  return PKey(EVP_RSA_gen(2048), &EVP_PKEY_free);
}

std::string to_pem(EVP_PKEY* key) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
  PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr);
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(len));
}

std::string base64url_decode(std::string s) {
  for (char& c : s) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
  }
  while (s.size() % 4 != 0) s += '=';
  std::string out(s.size(), '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(s.data()),
                                static_cast<int>(s.size()));
  size_t padding = 0;
  for (auto it = s.rbegin(); it != s.rend() && *it == '='; ++it) ++padding;
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

bool verify(EVP_PKEY* key, const std::string& data, const std::string& sig) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  return EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) == 1
      && EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(sig.data()), sig.size(),
                          reinterpret_cast<const unsigned char*>(data.data()), data.size()) == 1;
}

}

TEST(Jwt, Base64UrlHasNoPaddingOrUnsafeCharacters) {
  EXPECT_EQ(nb::base64url(""), "");
  EXPECT_EQ(nb::base64url("f"), "Zg");
  EXPECT_EQ(nb::base64url("fo"), "Zm8");
  EXPECT_EQ(nb::base64url("foo"), "Zm9v");
  EXPECT_EQ(nb::base64url("\xfb\xff\xbf"), "-_-_");
}

TEST(Jwt, SignatureVerifiesWithPublicKey) {
  auto key = generate_key();
  ASSERT_NE(key, nullptr);

  const std::string sig = nb::sign_rs256(to_pem(key.get()), "header.payload");
  EXPECT_EQ(sig.size(), 256u);
  EXPECT_TRUE(verify(key.get(), "header.payload", sig));
  EXPECT_FALSE(verify(key.get(), "header.tampered", sig));
}

TEST(Jwt, InvalidKeyIsConfigError) {
  EXPECT_THROW(nb::sign_rs256("not a key", "data"), nb::ConfigError);
}

TEST(Jwt, ServiceAccountAssertionClaims) {
  auto key = generate_key();
  ASSERT_NE(key, nullptr);
  const auto issuedAt = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

  const std::string jwt = nb::make_service_account_assertion(
    "builder@project.iam.gserviceaccount.com", to_pem(key.get()),
    "https://www.googleapis.com/auth/cloud-platform", "https://oauth2.googleapis.com/token", issuedAt);

  const auto dot1 = jwt.find('.');
  const auto dot2 = jwt.find('.', dot1 + 1);
  ASSERT_NE(dot1, std::string::npos);
  ASSERT_NE(dot2, std::string::npos);

  const auto header = nlohmann::json::parse(base64url_decode(jwt.substr(0, dot1)));
  EXPECT_EQ(header["alg"], "RS256");
  EXPECT_EQ(header["typ"], "JWT");

  const auto claims = nlohmann::json::parse(base64url_decode(jwt.substr(dot1 + 1, dot2 - dot1 - 1)));
  EXPECT_EQ(claims["iss"], "builder@project.iam.gserviceaccount.com");
  EXPECT_EQ(claims["scope"], "https://www.googleapis.com/auth/cloud-platform");
  EXPECT_EQ(claims["aud"], "https://oauth2.googleapis.com/token");
  EXPECT_EQ(claims["iat"], 1700000000);
  EXPECT_EQ(claims["exp"], 1700003600);

  EXPECT_TRUE(verify(key.get(), jwt.substr(0, dot2), base64url_decode(jwt.substr(dot2 + 1))));
}
