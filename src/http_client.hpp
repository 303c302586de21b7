#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"

class HttpError : public std::runtime_error {
public:
  enum class Kind {
    Resolve,
    Connect,
    Tls,
    Timeout,
    Io,
    Protocol,
    TooManyRedirects,
    BadUrl
  };

  HttpError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

const char* http_error_label(HttpError::Kind kind);

// "bytes <first>-<last>/<complete>", complete is absent for "*"
struct ContentRange {
  uint64_t first = 0;
  uint64_t last = 0;
  std::optional<uint64_t> complete_length;
};

std::optional<ContentRange> parse_content_range(const std::string& value);

struct HttpResponseHead {
  int status = 0;
  std::string reason;
  std::optional<uint64_t> content_length;
  bool chunked = false;
  bool accept_ranges = false;
  std::optional<ContentRange> content_range;
  std::string location;
  std::string final_url;
  std::vector<std::pair<std::string, std::string>> headers;

  std::optional<std::string> header(const std::string& name) const;
  bool is_redirect() const;
  bool is_success() const { return status >= 200 && status < 300; }
};

// Parses the status line and header fields. headerBlock excludes the blank line.
bool parse_response_head(const std::string& header_block, HttpResponseHead& out, std::string& error);

class HttpClient {
public:
  struct Options {
    std::chrono::milliseconds timeout{30000};
    int max_redirects = 5;
    bool verify_tls = true;
    std::string ca_file; // PEM bundle; empty = system trust store
    std::size_t read_chunk = 32 * 1024;
    std::string user_agent = "rfetch/1.0";
  };

  // Receives the final (post-redirect) head before any body byte. Throwing aborts the request.
  using HeadHandler = std::function<void(const HttpResponseHead&)>;
  // Receives body bytes in pieces of at most read_chunk. Returning false stops the transfer.
  using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

  explicit HttpClient(Options options, std::shared_ptr<Logger> logger = nullptr);
  HttpClient();
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponseHead head(const std::string& url);

  HttpResponseHead get(const std::string& url,
                       std::optional<uint64_t> range_start,
                       const HeadHandler& on_head,
                       const BodyHandler& on_body);

  const Options& options() const { return options_; }

private:
  struct Impl;

  HttpResponseHead perform(const std::string& method,
                           const std::string& url,
                           std::optional<uint64_t> range_start,
                           const HeadHandler& on_head,
                           const BodyHandler& on_body);

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<Impl> impl_;
};
