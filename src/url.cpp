#include "url.hpp"

#include <cstdlib>

#include "utils.hpp"

namespace {

uint16_t default_port(const std::string& scheme) {
  return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::authority() const {
  std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
  if(port == default_port(scheme)) return name;
  return name + ":" + std::to_string(port);
}

std::string Url::to_string() const {
  return scheme + "://" + authority() + target;
}

std::optional<Url> parse_url(const std::string& text) {
  auto sep = text.find("://");
  if(sep == std::string::npos) return std::nullopt;

  Url url;
  url.scheme = to_lower(text.substr(0, sep));
  if(url.scheme != "http" && url.scheme != "https") return std::nullopt;

  auto rest = text.substr(sep + 3);
  auto fragment = rest.find('#');
  if(fragment != std::string::npos) rest.erase(fragment);

  auto path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  url.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
  if(url.target.front() == '?') url.target.insert(url.target.begin(), '/');

  auto at = authority.rfind('@');
  if(at != std::string::npos) authority.erase(0, at + 1);
  if(authority.empty()) return std::nullopt;

  url.port = default_port(url.scheme);
  std::string host = authority;
  if(authority.front() == '[') {
    auto close = authority.find(']');
    if(close == std::string::npos) return std::nullopt;
    host = authority.substr(1, close - 1);
    if(close + 1 < authority.size()) {
      if(authority[close + 1] != ':') return std::nullopt;
      auto port_text = authority.substr(close + 2);
      char* end = nullptr;
      long port = std::strtol(port_text.c_str(), &end, 10);
      if(port_text.empty() || *end != '\0' || port <= 0 || port > 65535) return std::nullopt;
      url.port = static_cast<uint16_t>(port);
    }
  } else {
    auto colon = authority.rfind(':');
    if(colon != std::string::npos) {
      host = authority.substr(0, colon);
      auto port_text = authority.substr(colon + 1);
      char* end = nullptr;
      long port = std::strtol(port_text.c_str(), &end, 10);
      if(port_text.empty() || *end != '\0' || port <= 0 || port > 65535) return std::nullopt;
      url.port = static_cast<uint16_t>(port);
    }
  }
  if(host.empty()) return std::nullopt;
  url.host = host;
  return url;
}

std::optional<Url> resolve_redirect(const Url& base, const std::string& location) {
  if(location.empty()) return std::nullopt;
  if(location.find("://") != std::string::npos) return parse_url(location);
  if(location.rfind("//", 0) == 0) return parse_url(base.scheme + ":" + location);

  Url next = base;
  if(location.front() == '/') {
    next.target = location;
  } else {
    std::string dir = base.target.substr(0, base.target.find('?'));
    dir.erase(dir.find_last_of('/') + 1);
    next.target = dir + location;
  }
  return next;
}
