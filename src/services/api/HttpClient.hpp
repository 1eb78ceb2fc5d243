#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  int status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Seam for outbound HTTP. Implementations throw TransportError when no
// response is received; any status code is returned as a response.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
  virtual HttpResponse post(const std::string& url,
                            const HttpHeaders& headers,
                            const std::string& body,
                            const std::string& contentType) = 0;
};

// cpp-httplib client; https needs CPPHTTPLIB_OPENSSL_SUPPORT. timeout bounds
// each request as a whole, not only each socket wait.
class HttplibClient : public HttpClient {
public:
  explicit HttplibClient(std::chrono::seconds timeout) : timeout_(timeout) {}

  HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
  HttpResponse post(const std::string& url,
                    const HttpHeaders& headers,
                    const std::string& body,
                    const std::string& contentType) override;

private:
  std::chrono::seconds timeout_;
};

// -------- url helpers --------

std::string url_encode(std::string_view s);

// "https://host:443/a/b?c=d" -> {"https://host:443", "/a/b?c=d"}
std::pair<std::string, std::string> split_url(const std::string& url);

// Adds key=value to the query string, keeping any existing parameters.
std::string append_query(const std::string& url, const std::string& key, const std::string& value);

// application/x-www-form-urlencoded body.
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

}
