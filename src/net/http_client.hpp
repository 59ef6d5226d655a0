#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace relay::net {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;   // empty when not given
  std::string path;   // "/" when not given
  std::string query;  // including the leading '?'

  static std::optional<ParsedUrl> parse(const std::string &url);

  std::string port_or_default() const;
  bool is_https() const {
    return scheme == "https";
  }
  std::string target() const {
    return path + query;
  }
};

// Incremental decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Appends decoded body bytes to `out`. Returns true once the final chunk has been consumed.
  // Throws std::runtime_error on a malformed chunk header.
  bool feed(std::string_view data, std::string &out);

  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  size_t remaining_ = 0;
  std::string pending_;
};

struct HttpRequest {
  std::string method = "POST";
  ParsedUrl url;
  std::map<std::string, std::string> headers;
  std::string body;
  // Applies to each connect, handshake, write and read on its own
  std::chrono::milliseconds timeout = std::chrono::seconds(120);
};

// Blocking HTTP/1.1 exchange whose response body is read incrementally.
// https URLs go through TLS with peer and host name verification.
// The constructor connects, sends the request and reads the response headers;
// it throws on connection, handshake or timeout failures.
class HttpStream {
 public:
  explicit HttpStream(const HttpRequest &request);
  ~HttpStream();

  HttpStream(const HttpStream &) = delete;
  HttpStream &operator=(const HttpStream &) = delete;

  int status_code() const {
    return status_code_;
  }
  bool ok() const {
    return status_code_ >= 200 && status_code_ < 300;
  }

  // Header names are lower-cased
  std::optional<std::string> header(const std::string &name) const;

  // Next piece of decoded body; std::nullopt at end of body
  std::optional<std::string> read_some();

  // Remaining body in one string
  std::string read_all();

 private:
  void connect(const ParsedUrl &url);
  void read_headers();
  void fill_buffer();
  void consume_buffer(std::string &out);

  // Calls fn with the TLS stream or the bare socket
  template <typename Fn>
  void with_stream(Fn &&fn);

  // Runs the operation started by `start` until it completes or the timeout passes.
  // Throws on timeout; otherwise returns the operation's error code.
  template <typename Start>
  std::error_code run_with_deadline(const char *what, Start &&start, std::size_t &bytes);

  asio::io_context io_;
  asio::ssl::context tls_context_;
  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  std::chrono::milliseconds timeout_;
  bool tls_ = false;

  int status_code_ = 0;
  std::map<std::string, std::string> headers_;

  std::string buffer_;
  bool chunked_ = false;
  ChunkedDecoder chunked_decoder_;
  std::optional<size_t> remaining_;  // from Content-Length
  bool finished_ = false;
};

}  // namespace relay::net
