#pragma once
#include <openssl/sha.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Incremental SHA-256 over OpenSSL. Throws std::runtime_error if OpenSSL refuses a step.
class Sha256Stream {
public:
  Sha256Stream();
  void update(const char* data, std::size_t size);
  // Lowercase hex digest. The stream cannot be updated afterwards.
  std::string finish_hex();

private:
  SHA256_CTX ctx_;
  bool finished_ = false;
};

std::string to_lower(std::string value);
std::string trim(std::string value);

// Digits only, in the given base. nullopt on empty input, stray characters or overflow.
std::optional<uint64_t> parse_u64(const std::string& text, int base = 10);
bool iequals(const std::string& a, const std::string& b);

// True for a 64 character SHA-256 hex digest, either case.
bool is_hex_digest(const std::string& value);

// Final path segment of a URI, without query or fragment. Empty if the path ends in '/'.
std::string file_name_from_locator(const std::string& locator);

// 512 -> "512b", 1536 -> "1.5K", 3221225472 -> "3G"
std::string format_size(uint64_t bytes);
