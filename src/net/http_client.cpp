#include "net/http_client.hpp"

#include <openssl/err.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace relay::net {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return std::nullopt;
  }

  ParsedUrl out;
  out.scheme = to_lower(url.substr(0, scheme_end));

  auto rest = url.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?");
  auto authority = rest.substr(0, path_start);
  if (authority.empty()) {
    return std::nullopt;
  }

  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
  }
  if (out.host.empty()) {
    return std::nullopt;
  }

  std::string remainder = path_start == std::string::npos ? "" : rest.substr(path_start);
  auto query_start = remainder.find('?');
  out.path = remainder.substr(0, query_start);
  if (query_start != std::string::npos) {
    out.query = remainder.substr(query_start);
  }
  if (out.path.empty()) {
    out.path = "/";
  }
  return out;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

// ============================================================
// ChunkedDecoder
// ============================================================

bool ChunkedDecoder::feed(std::string_view data, std::string &out) {
  pending_.append(data.data(), data.size());

  while (state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        auto eol = pending_.find("\r\n");
        if (eol == std::string::npos) return false;

        auto line = pending_.substr(0, eol);
        auto ext = line.find(';');
        if (ext != std::string::npos) line.resize(ext);
        line = trim(line);
        if (line.empty() || !std::all_of(line.begin(), line.end(), [](unsigned char c) {
              return std::isxdigit(c) != 0;
            })) {
          throw std::runtime_error("Malformed chunk size line: '" + line + "'");
        }

        remaining_ = std::stoul(line, nullptr, 16);
        pending_.erase(0, eol + 2);
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        if (pending_.empty()) return false;
        auto n = std::min(remaining_, pending_.size());
        out.append(pending_, 0, n);
        pending_.erase(0, n);
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd:
        if (pending_.size() < 2) return false;
        pending_.erase(0, 2);
        state_ = State::Size;
        break;
      case State::Trailer: {
        auto eol = pending_.find("\r\n");
        if (eol == std::string::npos) return false;
        bool blank = eol == 0;
        pending_.erase(0, eol + 2);
        if (blank) state_ = State::Done;
        break;
      }
      case State::Done:
        break;
    }
  }
  return true;
}

// ============================================================
// HttpStream
// ============================================================

template <typename Fn>
void HttpStream::with_stream(Fn &&fn) {
  if (tls_) {
    fn(stream_);
  } else {
    fn(stream_.next_layer());
  }
}

template <typename Start>
std::error_code HttpStream::run_with_deadline(const char *what, Start &&start, std::size_t &bytes) {
  std::error_code result;
  bool finished = false;
  bool timed_out = false;

  asio::steady_timer timer(io_);
  timer.expires_after(timeout_);
  timer.async_wait([&](const std::error_code &ec) {
    if (ec || finished) return;
    timed_out = true;
    std::error_code ignored;
    stream_.next_layer().cancel(ignored);
  });

  start([&](const std::error_code &ec, std::size_t n) {
    finished = true;
    result = ec;
    bytes = n;
    timer.cancel();
  });

  io_.restart();
  io_.run();

  if (timed_out) {
    spdlog::warn("[HTTP] {} timed out after {} ms", what, timeout_.count());
    throw std::runtime_error(std::string(what) + " timed out after " + std::to_string(timeout_.count()) + " ms");
  }
  return result;
}

HttpStream::HttpStream(const HttpRequest &request)
    : tls_context_(asio::ssl::context::tls_client),
      stream_(io_, tls_context_),
      timeout_(request.timeout),
      tls_(request.url.is_https()) {
  if (request.url.scheme != "http" && !tls_) {
    throw std::invalid_argument("Unsupported URL scheme: " + request.url.scheme);
  }
  connect(request.url);

  std::ostringstream wire;
  wire << request.method << " " << request.url.target() << " HTTP/1.1\r\n";
  wire << "Host: " << request.url.host;
  if (!request.url.port.empty()) wire << ":" << request.url.port;
  wire << "\r\n";
  for (const auto &[key, value] : request.headers) {
    wire << key << ": " << value << "\r\n";
  }
  wire << "Content-Length: " << request.body.size() << "\r\n";
  wire << "Connection: close\r\n\r\n";
  wire << request.body;

  const auto payload = wire.str();
  std::size_t written = 0;
  auto ec = run_with_deadline("Sending HTTP request", [&](auto done) {
    with_stream([&](auto &stream) {
      asio::async_write(stream, asio::buffer(payload), done);
    });
  }, written);
  if (ec) {
    throw std::system_error(ec, "Failed to send HTTP request");
  }

  read_headers();
}

HttpStream::~HttpStream() {
  std::error_code ec;
  stream_.next_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  stream_.next_layer().close(ec);
}

void HttpStream::connect(const ParsedUrl &url) {
  asio::ip::tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(url.host, url.port_or_default());

  std::size_t unused = 0;
  auto ec = run_with_deadline("Connecting", [&](auto done) {
    asio::async_connect(stream_.next_layer(), endpoints, [done](const std::error_code &error, const asio::ip::tcp::endpoint &) {
      done(error, 0);
    });
  }, unused);
  if (ec) {
    throw std::system_error(ec, "Failed to connect to " + url.host);
  }

  if (!tls_) return;

  tls_context_.set_default_verify_paths();
  stream_.set_verify_mode(asio::ssl::verify_peer);
  stream_.set_verify_callback(asio::ssl::host_name_verification(url.host));
  // SNI
  if (!SSL_set_tlsext_host_name(stream_.native_handle(), url.host.c_str())) {
    throw std::system_error(std::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
                            "Failed to set TLS server name");
  }

  ec = run_with_deadline("TLS handshake", [&](auto done) {
    stream_.async_handshake(asio::ssl::stream_base::client, [done](const std::error_code &error) {
      done(error, 0);
    });
  }, unused);
  if (ec) {
    throw std::system_error(ec, "TLS handshake with " + url.host + " failed");
  }
  spdlog::debug("[HTTP] TLS established with {}", url.host);
}

void HttpStream::read_headers() {
  std::size_t n = 0;
  auto ec = run_with_deadline("Reading HTTP response headers", [&](auto done) {
    with_stream([&](auto &stream) {
      asio::async_read_until(stream, asio::dynamic_buffer(buffer_), "\r\n\r\n", done);
    });
  }, n);
  if (ec) {
    throw std::system_error(ec, "Failed to read HTTP response headers");
  }

  std::string head = buffer_.substr(0, n);
  buffer_.erase(0, n);

  std::istringstream lines(head);
  std::string status_line;
  std::getline(lines, status_line);
  {
    std::istringstream status(status_line);
    std::string version;
    status >> version >> status_code_;
    if (version.rfind("HTTP/", 0) != 0 || status_code_ == 0) {
      throw std::runtime_error("Malformed HTTP status line: " + trim(status_line));
    }
  }

  std::string line;
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    headers_[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  if (auto te = header("transfer-encoding"); te && to_lower(*te).find("chunked") != std::string::npos) {
    chunked_ = true;
  } else if (auto length = header("content-length")) {
    remaining_ = std::stoul(*length);
    if (*remaining_ == 0) finished_ = true;
  }

  spdlog::debug("[HTTP] Response status {} (chunked: {})", status_code_, chunked_);
}

std::optional<std::string> HttpStream::header(const std::string &name) const {
  auto it = headers_.find(to_lower(name));
  if (it == headers_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> HttpStream::read_some() {
  std::string out;
  while (out.empty() && !finished_) {
    if (buffer_.empty()) {
      fill_buffer();
      continue;
    }
    consume_buffer(out);
  }
  if (out.empty()) return std::nullopt;
  return out;
}

std::string HttpStream::read_all() {
  std::string body;
  while (auto piece = read_some()) {
    body += *piece;
  }
  return body;
}

void HttpStream::fill_buffer() {
  char tmp[4096];
  std::size_t n = 0;
  auto ec = run_with_deadline("Reading HTTP response body", [&](auto done) {
    with_stream([&](auto &stream) {
      stream.async_read_some(asio::buffer(tmp), done);
    });
  }, n);

  // Servers often close TLS connections without close_notify
  if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
    if (chunked_ && !chunked_decoder_.done()) {
      throw std::runtime_error("Connection closed before the end of the chunked body");
    }
    if (remaining_ && *remaining_ > 0) {
      throw std::runtime_error("Connection closed before the end of the body");
    }
    finished_ = true;
    return;
  }
  if (ec) {
    throw std::system_error(ec, "Failed to read HTTP response body");
  }
  buffer_.append(tmp, n);
}

void HttpStream::consume_buffer(std::string &out) {
  if (chunked_) {
    if (chunked_decoder_.feed(buffer_, out)) finished_ = true;
  } else if (remaining_) {
    auto n = std::min(*remaining_, buffer_.size());
    out.append(buffer_, 0, n);
    *remaining_ -= n;
    if (*remaining_ == 0) finished_ = true;
  } else {
    out.append(buffer_);
  }
  buffer_.clear();
}

}  // namespace relay::net
