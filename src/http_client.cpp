#include "http_client.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <type_traits>

#include "url.hpp"
#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

// One connection, one request. Every operation is bounded by the timeout.
class Channel {
public:
  virtual ~Channel() = default;
  virtual void open(const Url& url) = 0;
  virtual void write_all(const std::string& data) = 0;
  virtual std::size_t read_some(char* out, std::size_t size, bool& eof) = 0;
};

template<typename Stream>
class StreamChannel : public Channel {
public:
  static constexpr bool kTls = !std::is_same<Stream, tcp::socket>::value;

  template<typename... Args>
  StreamChannel(asio::io_context& io, std::chrono::milliseconds timeout, bool verify_tls, Args&&... args)
    : io_(io), timeout_(timeout), verify_tls_(verify_tls), stream_(io, std::forward<Args>(args)...) {}

  ~StreamChannel() override {
    close();
  }

  void open(const Url& url) override {
    tcp::resolver resolver(io_);
    tcp::resolver::results_type endpoints;
    std::error_code resolve_ec;
    bool resolved = false;
    resolver.async_resolve(url.host, std::to_string(url.port),
      [&](const std::error_code& ec, tcp::resolver::results_type results){
        resolve_ec = ec;
        endpoints = std::move(results);
        resolved = true;
      });
    await(resolved, "resolve " + url.host, [&]{ resolver.cancel(); });
    if(resolve_ec) {
      throw HttpError(HttpError::Kind::Resolve,
                      "Unable to resolve " + url.host + ": " + resolve_ec.message());
    }

    std::error_code connect_ec;
    bool connected = false;
    asio::async_connect(stream_.lowest_layer(), endpoints,
      [&](const std::error_code& ec, const tcp::endpoint&){
        connect_ec = ec;
        connected = true;
      });
    await(connected, "connect " + url.authority(), [&]{ close(); });
    if(connect_ec) {
      throw HttpError(HttpError::Kind::Connect,
                      "Unable to connect to " + url.authority() + ": " + connect_ec.message());
    }

    if constexpr(kTls) {
      if(!SSL_set_tlsext_host_name(stream_.native_handle(), url.host.c_str())) {
        throw HttpError(HttpError::Kind::Tls, "Unable to set TLS server name for " + url.host);
      }
      std::error_code verify_ec;
      if(verify_tls_) {
        stream_.set_verify_mode(asio::ssl::verify_peer, verify_ec);
        if(!verify_ec) stream_.set_verify_callback(asio::ssl::host_name_verification(url.host), verify_ec);
      } else {
        stream_.set_verify_mode(asio::ssl::verify_none, verify_ec);
      }
      if(verify_ec) {
        throw HttpError(HttpError::Kind::Tls,
                        "Unable to configure TLS verification for " + url.host + ": " + verify_ec.message());
      }
      std::error_code handshake_ec;
      bool shook = false;
      stream_.async_handshake(asio::ssl::stream_base::client,
        [&](const std::error_code& ec){
          handshake_ec = ec;
          shook = true;
        });
      await(shook, "TLS handshake with " + url.host, [&]{ close(); });
      if(handshake_ec) {
        throw HttpError(HttpError::Kind::Tls,
                        "TLS handshake with " + url.host + " failed: " + handshake_ec.message());
      }
    }
  }

  void write_all(const std::string& data) override {
    std::error_code write_ec;
    bool written = false;
    asio::async_write(stream_, asio::buffer(data),
      [&](const std::error_code& ec, std::size_t){
        write_ec = ec;
        written = true;
      });
    await(written, "request write", [&]{ close(); });
    if(write_ec) {
      throw HttpError(HttpError::Kind::Io, "Request write failed: " + write_ec.message());
    }
  }

  std::size_t read_some(char* out, std::size_t size, bool& eof) override {
    std::error_code read_ec;
    std::size_t transferred = 0;
    bool done = false;
    stream_.async_read_some(asio::buffer(out, size),
      [&](const std::error_code& ec, std::size_t n){
        read_ec = ec;
        transferred = n;
        done = true;
      });
    await(done, "response read", [&]{ close(); });
    eof = false;
    if(read_ec) {
      if(read_ec == asio::error::eof || is_truncation(read_ec)) {
        eof = true;
      } else {
        throw HttpError(HttpError::Kind::Io, "Response read failed: " + read_ec.message());
      }
    }
    return transferred;
  }

private:
  static bool is_truncation(const std::error_code& ec) {
    if constexpr(kTls) {
      return ec == asio::ssl::error::stream_truncated;
    } else {
      (void)ec;
      return false;
    }
  }

  template<typename Cancel>
  void await(bool& done, const std::string& what, Cancel&& cancel) {
    io_.restart();
    io_.run_for(timeout_);
    if(done) return;
    cancel();
    io_.restart();
    io_.run();
    throw HttpError(HttpError::Kind::Timeout,
                    what + " timed out after " + std::to_string(timeout_.count()) + "ms");
  }

  void close() {
    std::error_code ignored;
    stream_.lowest_layer().close(ignored);
  }

  asio::io_context& io_;
  std::chrono::milliseconds timeout_;
  bool verify_tls_;
  Stream stream_;
};

// Buffers socket reads so the head and chunk framing can be consumed line by line.
class ResponseReader {
public:
  ResponseReader(Channel& channel, std::size_t chunk)
    : channel_(channel), scratch_(std::max<std::size_t>(chunk, 1024)) {}

  std::string read_head() {
    for(;;) {
      auto end = buffer_.find("\r\n\r\n", pos_);
      if(end != std::string::npos) {
        std::string block = buffer_.substr(pos_, end - pos_);
        pos_ = end + 4;
        return block;
      }
      if(buffer_.size() - pos_ > kMaxHeaderBytes) {
        throw HttpError(HttpError::Kind::Protocol, "Response header exceeds 64KiB");
      }
      if(!fill()) {
        throw HttpError(HttpError::Kind::Protocol, "Connection closed before response header completed");
      }
    }
  }

  std::string read_line() {
    for(;;) {
      auto end = buffer_.find("\r\n", pos_);
      if(end != std::string::npos) {
        std::string line = buffer_.substr(pos_, end - pos_);
        pos_ = end + 2;
        return line;
      }
      if(!fill()) {
        throw HttpError(HttpError::Kind::Protocol, "Connection closed inside chunk framing");
      }
    }
  }

  // Returns up to max bytes, 0 only at end of stream.
  std::size_t read_body(const char*& data, std::size_t max) {
    if(pos_ >= buffer_.size() && !fill()) return 0;
    std::size_t n = std::min(max, buffer_.size() - pos_);
    data = buffer_.data() + pos_;
    pos_ += n;
    return n;
  }

private:
  bool fill() {
    if(eof_) return false;
    if(pos_ > 0) {
      buffer_.erase(0, pos_);
      pos_ = 0;
    }
    bool eof = false;
    std::size_t n = channel_.read_some(scratch_.data(), scratch_.size(), eof);
    buffer_.append(scratch_.data(), n);
    if(eof) eof_ = true;
    return n > 0 || !eof_;
  }

  Channel& channel_;
  std::vector<char> scratch_;
  std::string buffer_;
  std::size_t pos_ = 0;
  bool eof_ = false;
};

bool body_expected(const std::string& method, int status) {
  if(method == "HEAD") return false;
  if(status < 200 || status == 204 || status == 304) return false;
  return true;
}

} // namespace

const char* http_error_label(HttpError::Kind kind) {
  switch(kind) {
    case HttpError::Kind::Resolve: return "resolve";
    case HttpError::Kind::Connect: return "connect";
    case HttpError::Kind::Tls: return "tls";
    case HttpError::Kind::Timeout: return "timeout";
    case HttpError::Kind::Io: return "io";
    case HttpError::Kind::Protocol: return "protocol";
    case HttpError::Kind::TooManyRedirects: return "redirects";
    case HttpError::Kind::BadUrl: return "url";
  }
  return "unknown";
}

std::optional<ContentRange> parse_content_range(const std::string& value) {
  std::string text = trim(value);
  if(to_lower(text.substr(0, 6)) != "bytes ") return std::nullopt;
  text = trim(text.substr(6));
  auto dash = text.find('-');
  auto slash = text.find('/');
  if(dash == std::string::npos || slash == std::string::npos || dash > slash) return std::nullopt;

  auto first = parse_u64(text.substr(0, dash));
  auto last = parse_u64(text.substr(dash + 1, slash - dash - 1));
  if(!first || !last || *last < *first) return std::nullopt;
  ContentRange range;
  range.first = *first;
  range.last = *last;
  std::string complete = text.substr(slash + 1);
  if(complete != "*") {
    range.complete_length = parse_u64(complete);
    if(!range.complete_length) return std::nullopt;
  }
  return range;
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
  for(const auto& field : headers) {
    if(iequals(field.first, name)) return field.second;
  }
  return std::nullopt;
}

bool HttpResponseHead::is_redirect() const {
  return (status == 301 || status == 302 || status == 303 || status == 307 || status == 308) &&
         !location.empty();
}

bool parse_response_head(const std::string& header_block, HttpResponseHead& out, std::string& error) {
  out = HttpResponseHead{};
  std::istringstream lines(header_block);
  std::string status_line;
  if(!std::getline(lines, status_line)) {
    error = "empty response header";
    return false;
  }
  if(!status_line.empty() && status_line.back() == '\r') status_line.pop_back();
  if(status_line.rfind("HTTP/", 0) != 0) {
    error = "malformed status line '" + status_line + "'";
    return false;
  }
  std::istringstream sl(status_line);
  std::string version;
  sl >> version >> out.status;
  if(!sl || out.status < 100 || out.status > 999) {
    error = "malformed status line '" + status_line + "'";
    return false;
  }
  std::getline(sl, out.reason);
  out.reason = trim(out.reason);

  std::string line;
  while(std::getline(lines, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    auto colon = line.find(':');
    if(colon == std::string::npos) continue;
    std::string key = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));
    std::string key_lower = to_lower(key);
    if(key_lower == "content-length") {
      out.content_length = parse_u64(value);
      if(!out.content_length) {
        error = "invalid Content-Length '" + value + "'";
        return false;
      }
    } else if(key_lower == "transfer-encoding") {
      out.chunked = to_lower(value).find("chunked") != std::string::npos;
    } else if(key_lower == "accept-ranges") {
      out.accept_ranges = to_lower(value).find("bytes") != std::string::npos;
    } else if(key_lower == "content-range") {
      out.content_range = parse_content_range(value);
    } else if(key_lower == "location") {
      out.location = value;
    }
    out.headers.emplace_back(std::move(key), std::move(value));
  }
  // a chunked body ignores any declared length
  if(out.chunked) out.content_length.reset();
  return true;
}

struct HttpClient::Impl {
  asio::io_context io;
  std::unique_ptr<asio::ssl::context> tls;

  // Built on first https use and kept only once the trust store loaded.
  asio::ssl::context& tls_context(const Options& options) {
    if(tls) return *tls;
    std::unique_ptr<asio::ssl::context> context;
    try {
      context = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
    } catch(const std::system_error& e) {
      throw HttpError(HttpError::Kind::Tls, std::string("Unable to create TLS context: ") + e.what());
    }
    if(options.verify_tls) {
      std::error_code ec;
      if(options.ca_file.empty()) {
        context->set_default_verify_paths(ec);
      } else {
        context->load_verify_file(options.ca_file, ec);
      }
      if(ec) {
        throw HttpError(HttpError::Kind::Tls,
                        "Unable to load trust store " +
                        (options.ca_file.empty() ? std::string("(system default)") : options.ca_file) +
                        ": " + ec.message());
      }
    }
    tls = std::move(context);
    return *tls;
  }

  std::unique_ptr<Channel> make_channel(const Url& url, const Options& options) {
    try {
      if(url.is_tls()) {
        return std::make_unique<StreamChannel<asio::ssl::stream<tcp::socket>>>(
          io, options.timeout, options.verify_tls, tls_context(options));
      }
      return std::make_unique<StreamChannel<tcp::socket>>(io, options.timeout, options.verify_tls);
    } catch(const std::system_error& e) {
      throw HttpError(url.is_tls() ? HttpError::Kind::Tls : HttpError::Kind::Connect,
                      "Unable to set up a connection to " + url.authority() + ": " + e.what());
    }
  }
};

HttpClient::HttpClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)),
    impl_(std::make_unique<Impl>()) {
  if(options_.read_chunk == 0) options_.read_chunk = 32 * 1024;
}

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::~HttpClient() = default;

HttpResponseHead HttpClient::head(const std::string& url) {
  return perform("HEAD", url, std::nullopt, {}, {});
}

HttpResponseHead HttpClient::get(const std::string& url,
                                 std::optional<uint64_t> range_start,
                                 const HeadHandler& on_head,
                                 const BodyHandler& on_body) {
  return perform("GET", url, range_start, on_head, on_body);
}

HttpResponseHead HttpClient::perform(const std::string& method,
                                     const std::string& url_text,
                                     std::optional<uint64_t> range_start,
                                     const HeadHandler& on_head,
                                     const BodyHandler& on_body) {
  auto url = parse_url(url_text);
  if(!url) {
    throw HttpError(HttpError::Kind::BadUrl, "Not an absolute http(s) URL: " + url_text);
  }

  for(int hop = 0; ; ++hop) {
    auto channel = impl_->make_channel(*url, options_);
    channel->open(*url);

    std::ostringstream request;
    request << method << " " << url->target << " HTTP/1.1\r\n"
            << "Host: " << url->authority() << "\r\n"
            << "User-Agent: " << options_.user_agent << "\r\n"
            << "Accept: */*\r\n"
            << "Accept-Encoding: identity\r\n";
    if(range_start) {
      request << "Range: bytes=" << *range_start << "-\r\n";
    }
    request << "Connection: close\r\n\r\n";
    log_debug(logger_.get(), "{} {}{}", method, url->to_string(),
              range_start ? " from byte " + std::to_string(*range_start) : std::string());
    channel->write_all(request.str());

    ResponseReader reader(*channel, options_.read_chunk);
    HttpResponseHead head;
    for(;;) {
      std::string error;
      if(!parse_response_head(reader.read_head(), head, error)) {
        throw HttpError(HttpError::Kind::Protocol, "Bad response from " + url->authority() + ": " + error);
      }
      if(head.status >= 200 || head.status == 101) break;
      // interim 1xx response, the real one follows
    }
    head.final_url = url->to_string();

    if(head.is_redirect()) {
      if(hop >= options_.max_redirects) {
        throw HttpError(HttpError::Kind::TooManyRedirects,
                        "Stopped after " + std::to_string(hop) + " redirects at " + url->to_string());
      }
      auto next = resolve_redirect(*url, head.location);
      if(!next) {
        throw HttpError(HttpError::Kind::BadUrl, "Unusable redirect target '" + head.location + "'");
      }
      log_debug(logger_.get(), "{} redirected ({}) to {}", url->to_string(), head.status, next->to_string());
      url = std::move(next);
      continue;
    }

    if(on_head) on_head(head);
    if(!body_expected(method, head.status)) return head;

    const char* data = nullptr;
    auto deliver = [&](std::size_t n) {
      return !on_body || on_body(data, n);
    };

    if(head.chunked) {
      for(;;) {
        std::string size_line = reader.read_line();
        auto ext = size_line.find(';');
        if(ext != std::string::npos) size_line.erase(ext);
        size_line = trim(size_line);
        auto chunk_size = parse_u64(size_line, 16);
        if(!chunk_size) {
          throw HttpError(HttpError::Kind::Protocol, "Invalid chunk size '" + size_line + "'");
        }
        uint64_t remaining = *chunk_size;
        if(remaining == 0) {
          while(!reader.read_line().empty()) {}
          break;
        }
        while(remaining > 0) {
          std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(remaining, options_.read_chunk));
          std::size_t n = reader.read_body(data, want);
          if(n == 0) {
            throw HttpError(HttpError::Kind::Protocol, "Connection closed inside a chunk");
          }
          remaining -= n;
          if(!deliver(n)) return head;
        }
        reader.read_line();
      }
    } else if(head.content_length) {
      uint64_t remaining = *head.content_length;
      uint64_t received = 0;
      while(remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(remaining, options_.read_chunk));
        std::size_t n = reader.read_body(data, want);
        if(n == 0) {
          throw HttpError(HttpError::Kind::Protocol,
                          "Connection closed after " + std::to_string(received) + " of " +
                          std::to_string(*head.content_length) + " body bytes");
        }
        remaining -= n;
        received += n;
        if(!deliver(n)) return head;
      }
    } else {
      for(;;) {
        std::size_t n = reader.read_body(data, options_.read_chunk);
        if(n == 0) break;
        if(!deliver(n)) return head;
      }
    }
    return head;
  }
}
