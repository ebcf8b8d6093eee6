#pragma once

#include <map>
#include <string>

#include <openssl/ssl.h>

namespace switchyard {

struct HttpResponse {
  int status{0};
  std::string body;
};

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

// Throws std::invalid_argument on a URL without host or with a bad port.
ParsedUrl ParseHttpUrl(const std::string &url);

// Reassembles a "Transfer-Encoding: chunked" body.
std::string DecodeChunkedBody(const std::string &body);

// Minimal blocking HTTP/1.1 client (one connection per request) used for
// provider side-channels such as embedding endpoints. TLS goes through
// OpenSSL with peer verification. Transport failures throw
// std::runtime_error; HTTP error statuses are returned to the caller.
class HttpClient {
public:
  explicit HttpClient(int timeout_ms = 30000);
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // Sends a JSON body with "Connection: close".
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;

  int timeout_ms() const { return timeout_ms_; }

private:
  SSL_CTX *ssl_ctx_{nullptr};
  int timeout_ms_{30000};
};

} // namespace switchyard
