#include "HttpClient.hpp"

#include <cctype>
#include <stdexcept>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace nb {

// -------- helpers --------

std::string url_encode(std::string_view s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += k[(c >> 4) & 0xF];
      out += k[c & 0xF];
    }
  }
  return out;
}

std::pair<std::string, std::string> split_url(const std::string& url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos) throw std::invalid_argument("not an absolute URL: " + url);
  const auto path = url.find('/', scheme + 3);
  if (path == std::string::npos) return {url, "/"};
  return {url.substr(0, path), url.substr(path)};
}

std::string append_query(const std::string& url, const std::string& key, const std::string& value) {
  const char sep = url.find('?') == std::string::npos ? '?' : '&';
  return url + sep + url_encode(key) + "=" + url_encode(value);
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string out;
  for (const auto& [k, v] : fields) {
    if (!out.empty()) out += '&';
    out += url_encode(k) + "=" + url_encode(v);
  }
  return out;
}

static httplib::Headers to_httplib(const HttpHeaders& headers) {
  httplib::Headers h;
  for (const auto& [k, v] : headers) h.emplace(k, v);
  return h;
}

// The per-phase timeouts restart on every socket wait; max_timeout bounds the
// whole request, including a server that trickles bytes.
static void configure(httplib::Client& cli, std::chrono::seconds timeout) {
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);
  cli.set_max_timeout(timeout);
}

static HttpResponse to_response(const std::string& url, const httplib::Result& res) {
  if (!res) {
    throw TransportError(url, 0, "", "HTTP request failed: " + httplib::to_string(res.error()));
  }
  spdlog::debug("HTTP {} from {}", res->status, url);
  return HttpResponse{res->status, res->body};
}

// -------- client --------

HttpResponse HttplibClient::get(const std::string& url, const HttpHeaders& headers) {
  const auto [origin, path] = split_url(url);
  httplib::Client cli(origin);
  configure(cli, timeout_);
  return to_response(url, cli.Get(path, to_httplib(headers)));
}

HttpResponse HttplibClient::post(const std::string& url,
                                 const HttpHeaders& headers,
                                 const std::string& body,
                                 const std::string& contentType) {
  const auto [origin, path] = split_url(url);
  httplib::Client cli(origin);
  configure(cli, timeout_);
  return to_response(url, cli.Post(path, to_httplib(headers), body, contentType));
}

} // namespace nb
