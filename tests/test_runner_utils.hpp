#pragma once

#include "log.hpp"
#include "fetch_engine.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fetch::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        record(label.empty() ? channel : label, message);
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(FetchEngine& engine, const std::string& label = std::string()) {
    auto handle = engine.add_log_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        record(label.empty() ? channel : label, message);
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &engine, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.engine && attachment.handle != 0) {
        attachment.engine->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool wait_for_substring(const std::string& needle, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    });
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    FetchEngine* engine = nullptr;
    LogListenerHandle handle = 0;
  };

  void record(const std::string& prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.emplace_back(prefix + ": " + message);
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

inline bool check(bool condition, const std::string& what) {
  if(!condition) {
    std::cout << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& name)
    : path_(std::filesystem::temp_directory_path() / ("rfetch_test_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

inline std::string pattern_bytes(std::size_t size, unsigned seed = 7) {
  std::string out(size, '\0');
  uint32_t state = seed * 2654435761u + 1;
  for(std::size_t i = 0; i < size; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = static_cast<char>(state >> 24);
  }
  return out;
}

inline std::string sha256_of(const std::string& data) {
  Sha256Stream digest;
  digest.update(data.data(), data.size());
  return digest.finish_hex();
}

inline void write_file(const std::filesystem::path& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Single-threaded HTTP/1.1 file server on 127.0.0.1 for exercising the
// downloader without a real network. One request per connection.
class LoopbackHttpServer {
public:
  struct Resource {
    std::string body;
    bool omit_length_on_head = false;
    bool ignore_range = false;
    bool chunked = false;
    std::optional<std::size_t> cut_after; // next GET closes after this many body bytes
    std::string redirect_to;              // answers 302 with this Location
    int status = 0;                       // forced status with an empty body
    std::chrono::milliseconds stall{0};   // hold the connection silent this long
  };

  struct Stats {
    std::size_t heads = 0;
    std::size_t gets = 0;
    uint64_t body_bytes_sent = 0;
    std::vector<std::string> ranges; // Range header of every GET ("" if none)
  };

  LoopbackHttpServer()
    : acceptor_(io_) {}

  ~LoopbackHttpServer() {
    stop();
  }

  void start() {
    using asio::ip::tcp;
    tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    thread_ = std::thread([this]{ serve(); });
  }

  void stop() {
    if(!running_.exchange(false)) return;
    {
      // wake the blocking accept
      asio::io_context wake_io;
      asio::ip::tcp::socket wake(wake_io);
      std::error_code ec;
      wake.connect({asio::ip::make_address("127.0.0.1"), port_}, ec);
    }
    if(thread_.joinable()) thread_.join();
    std::error_code ec;
    acceptor_.close(ec);
  }

  uint16_t port() const { return port_; }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  void set_resource(const std::string& path, Resource resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_[path] = std::move(resource);
  }

  void update_resource(const std::string& path, const std::function<void(Resource&)>& edit) {
    std::lock_guard<std::mutex> lock(mutex_);
    edit(resources_[path]);
  }

  Stats stats(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(path);
    return it == stats_.end() ? Stats{} : it->second;
  }

private:
  void serve() {
    while(running_) {
      asio::ip::tcp::socket socket(io_);
      std::error_code ec;
      acceptor_.accept(socket, ec);
      if(!running_) break;
      if(ec) continue;
      handle(socket);
      socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      socket.close(ec);
    }
  }

  static std::string status_text(int status) {
    switch(status) {
      case 200: return "OK";
      case 206: return "Partial Content";
      case 302: return "Found";
      case 404: return "Not Found";
      case 416: return "Range Not Satisfiable";
      case 500: return "Internal Server Error";
      default: return "Status";
    }
  }

  void handle(asio::ip::tcp::socket& socket) {
    std::error_code ec;
    asio::streambuf request_buf;
    asio::read_until(socket, request_buf, "\r\n\r\n", ec);
    if(ec) return;

    std::istream request(&request_buf);
    std::string method, path, version;
    request >> method >> path >> version;
    std::string line;
    std::getline(request, line);
    std::optional<uint64_t> range_start;
    std::string range_header;
    while(std::getline(request, line) && line != "\r" && !line.empty()) {
      if(line.back() == '\r') line.pop_back();
      auto colon = line.find(':');
      if(colon == std::string::npos) continue;
      std::string key = line.substr(0, colon);
      std::string value = line.substr(colon + 1);
      while(!value.empty() && value.front() == ' ') value.erase(value.begin());
      std::transform(key.begin(), key.end(), key.begin(),
                     [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
      if(key == "range" && value.rfind("bytes=", 0) == 0) {
        range_header = value;
        range_start = std::stoull(value.substr(6, value.find('-') - 6));
      }
    }

    Resource resource;
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = resources_.find(path);
      if(it != resources_.end()) {
        found = true;
        resource = it->second;
        if(method == "GET") it->second.cut_after.reset();
      }
      auto& stats = stats_[path];
      if(method == "HEAD") ++stats.heads;
      if(method == "GET") {
        ++stats.gets;
        stats.ranges.push_back(range_header);
      }
    }

    if(found && resource.stall.count() > 0) {
      auto deadline = std::chrono::steady_clock::now() + resource.stall;
      while(running_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      return;
    }

    std::ostringstream head;
    if(!found || resource.status != 0) {
      int status = found ? resource.status : 404;
      head << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n"
           << "Content-Length: 0\r\nConnection: close\r\n\r\n";
      asio::write(socket, asio::buffer(head.str()), ec);
      return;
    }
    if(!resource.redirect_to.empty()) {
      head << "HTTP/1.1 302 Found\r\nLocation: " << resource.redirect_to << "\r\n"
           << "Content-Length: 0\r\nConnection: close\r\n\r\n";
      asio::write(socket, asio::buffer(head.str()), ec);
      return;
    }

    const uint64_t size = resource.body.size();
    if(method == "HEAD") {
      head << "HTTP/1.1 200 OK\r\nAccept-Ranges: bytes\r\n";
      if(!resource.omit_length_on_head) head << "Content-Length: " << size << "\r\n";
      head << "Connection: close\r\n\r\n";
      asio::write(socket, asio::buffer(head.str()), ec);
      return;
    }

    std::string payload = resource.body;
    if(range_start && !resource.ignore_range) {
      if(*range_start >= size) {
        head << "HTTP/1.1 416 " << status_text(416) << "\r\n"
             << "Content-Range: bytes */" << size << "\r\n"
             << "Content-Length: 0\r\nConnection: close\r\n\r\n";
        asio::write(socket, asio::buffer(head.str()), ec);
        return;
      }
      payload = resource.body.substr(static_cast<std::size_t>(*range_start));
      head << "HTTP/1.1 206 " << status_text(206) << "\r\n"
           << "Content-Range: bytes " << *range_start << "-" << (size - 1) << "/" << size << "\r\n";
    } else {
      head << "HTTP/1.1 200 OK\r\n";
    }
    head << "Accept-Ranges: bytes\r\n";
    if(resource.chunked) {
      head << "Transfer-Encoding: chunked\r\n";
    } else {
      head << "Content-Length: " << payload.size() << "\r\n";
    }
    head << "Connection: close\r\n\r\n";
    asio::write(socket, asio::buffer(head.str()), ec);
    if(ec) return;

    std::size_t limit = resource.cut_after ? std::min(*resource.cut_after, payload.size()) : payload.size();
    std::string wire;
    if(resource.chunked) {
      for(std::size_t pos = 0; pos < limit; pos += 100) {
        std::size_t n = std::min<std::size_t>(100, limit - pos);
        std::ostringstream frame;
        frame << std::hex << n << "\r\n";
        wire += frame.str();
        wire.append(payload, pos, n);
        wire += "\r\n";
      }
      if(!resource.cut_after) wire += "0\r\n\r\n";
    } else {
      wire = payload.substr(0, limit);
    }
    asio::write(socket, asio::buffer(wire), ec);
    if(!ec) {
      std::lock_guard<std::mutex> lock(mutex_);
      stats_[path].body_bytes_sent += limit;
    }
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  uint16_t port_ = 0;
  mutable std::mutex mutex_;
  std::map<std::string, Resource> resources_;
  std::map<std::string, Stats> stats_;
};

} // namespace fetch::test
