#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct Url {
  std::string scheme;   // "http" or "https", lower case
  std::string host;
  uint16_t port = 0;    // explicit port or the scheme default
  std::string target;   // path + query, always starts with '/'

  bool is_tls() const { return scheme == "https"; }
  std::string authority() const;
  std::string to_string() const;
};

// Returns nullopt for anything that is not an absolute http(s) URI.
std::optional<Url> parse_url(const std::string& text);

// Resolves a Location header value against the URL it came from.
std::optional<Url> resolve_redirect(const Url& base, const std::string& location);
