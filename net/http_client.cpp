#include "net/http_client.h"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace switchyard {
namespace {

// Closes the descriptor on scope exit.
struct SocketGuard {
  int fd{-1};
  ~SocketGuard() {
    if (fd != -1) {
      ::close(fd);
    }
  }
};

// Shuts down and frees the TLS session on scope exit.
struct SslGuard {
  SSL *ssl{nullptr};
  bool connected{false};
  ~SslGuard() {
    if (ssl) {
      if (connected) {
        SSL_shutdown(ssl);
      }
      SSL_free(ssl);
    }
  }
};

int Connect(const ParsedUrl &target, int timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *addresses = nullptr;
  if (getaddrinfo(target.host.c_str(), std::to_string(target.port).c_str(),
                  &hints, &addresses) != 0) {
    throw std::runtime_error("cannot resolve " + target.host);
  }
  int fd = -1;
  for (addrinfo *ai = addresses; ai != nullptr && fd == -1; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd != -1 && ::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      ::close(fd);
      fd = -1;
    }
  }
  freeaddrinfo(addresses);
  if (fd == -1) {
    throw std::runtime_error("cannot connect to " + target.host + ":" +
                             std::to_string(target.port));
  }
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return fd;
}

std::string
SerializeRequest(const ParsedUrl &target, const std::string &body,
                 const std::map<std::string, std::string> &headers) {
  std::ostringstream out;
  out << "POST " << target.path << " HTTP/1.1\r\n"
      << "Host: " << target.host << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << body.size() << "\r\n";
  for (const auto &[name, value] : headers) {
    out << name << ": " << value << "\r\n";
  }
  out << "Connection: close\r\n\r\n" << body;
  return out.str();
}

std::string ExchangePlain(int fd, const std::string &payload) {
  std::size_t offset = 0;
  while (offset < payload.size()) {
    ssize_t n = ::send(fd, payload.data() + offset, payload.size() - offset, 0);
    if (n <= 0) {
      throw std::runtime_error("send failed");
    }
    offset += static_cast<std::size_t>(n);
  }
  std::string raw;
  char buffer[4096];
  ssize_t n = 0;
  while ((n = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
    raw.append(buffer, static_cast<std::size_t>(n));
  }
  return raw;
}

std::string ExchangeTls(SSL_CTX *ctx, int fd, const std::string &host,
                        const std::string &payload) {
  SslGuard session;
  session.ssl = SSL_new(ctx);
  if (!session.ssl) {
    throw std::runtime_error("cannot allocate TLS session");
  }
  SSL_set_tlsext_host_name(session.ssl, host.c_str());
  SSL_set1_host(session.ssl, host.c_str());
  SSL_set_fd(session.ssl, fd);
  if (SSL_connect(session.ssl) != 1) {
    throw std::runtime_error("TLS handshake with " + host + " failed");
  }
  session.connected = true;
  if (SSL_get_verify_result(session.ssl) != X509_V_OK) {
    throw std::runtime_error("TLS certificate of " + host + " rejected");
  }
  std::size_t offset = 0;
  while (offset < payload.size()) {
    int n = SSL_write(session.ssl, payload.data() + offset,
                      static_cast<int>(payload.size() - offset));
    if (n <= 0) {
      throw std::runtime_error("TLS send failed");
    }
    offset += static_cast<std::size_t>(n);
  }
  std::string raw;
  char buffer[4096];
  int n = 0;
  while ((n = SSL_read(session.ssl, buffer, sizeof(buffer))) > 0) {
    raw.append(buffer, static_cast<std::size_t>(n));
  }
  return raw;
}

HttpResponse ParseRawResponse(const std::string &raw) {
  HttpResponse response;
  auto split = raw.find("\r\n\r\n");
  std::string head = raw.substr(0, split);
  if (split != std::string::npos) {
    response.body = raw.substr(split + 4);
  }
  // "HTTP/1.1 200 OK"
  auto space = head.find(' ');
  if (space != std::string::npos) {
    try {
      response.status = std::stoi(head.substr(space + 1, 3));
    } catch (const std::exception &) {
      response.status = 0;
    }
  }
  std::transform(head.begin(), head.end(), head.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (head.find("transfer-encoding: chunked") != std::string::npos) {
    response.body = DecodeChunkedBody(response.body);
  }
  return response;
}

} // namespace

ParsedUrl ParseHttpUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string rest = url;
  if (auto sep = url.find("://"); sep != std::string::npos) {
    parsed.scheme = url.substr(0, sep);
    rest = url.substr(sep + 3);
  }
  parsed.use_tls = parsed.scheme == "https";
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    parsed.path = rest.substr(slash);
  }
  auto colon = authority.find(':');
  parsed.host = authority.substr(0, colon);
  if (colon != std::string::npos) {
    try {
      parsed.port = std::stoi(authority.substr(colon + 1));
    } catch (const std::exception &) {
      throw std::invalid_argument("invalid port in URL " + url);
    }
  }
  if (parsed.host.empty()) {
    throw std::invalid_argument("missing host in URL " + url);
  }
  return parsed;
}

std::string DecodeChunkedBody(const std::string &body) {
  std::string decoded;
  std::size_t pos = 0;
  while (pos < body.size()) {
    auto eol = body.find("\r\n", pos);
    if (eol == std::string::npos) {
      break;
    }
    std::size_t chunk = 0;
    try {
      chunk = std::stoul(body.substr(pos, eol - pos), nullptr, 16);
    } catch (const std::exception &) {
      break;
    }
    if (chunk == 0) {
      break;
    }
    pos = eol + 2;
    decoded.append(body, pos, std::min(chunk, body.size() - pos));
    pos += chunk + 2; // chunk data + CRLF
  }
  return decoded;
}

HttpClient::HttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : 30000) {
  OPENSSL_init_ssl(0, nullptr);
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
  }
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto target = ParseHttpUrl(url);
  if (target.use_tls && !ssl_ctx_) {
    throw std::runtime_error("TLS is unavailable for " + url);
  }
  SocketGuard socket;
  socket.fd = Connect(target, timeout_ms_);
  auto payload = SerializeRequest(target, body, headers);
  std::string raw = target.use_tls
                        ? ExchangeTls(ssl_ctx_, socket.fd, target.host, payload)
                        : ExchangePlain(socket.fd, payload);
  if (raw.empty()) {
    throw std::runtime_error("empty response from " + target.host);
  }
  return ParseRawResponse(raw);
}

} // namespace switchyard
