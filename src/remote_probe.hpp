#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "http_client.hpp"
#include "log.hpp"

struct RemoteObjectMeta {
  uint64_t total_size_bytes = 0; // 0 means the server did not say
  bool accepts_ranges = false;

  bool size_known() const { return total_size_bytes > 0; }
};

class RemoteProbe {
public:
  RemoteProbe(HttpClient& client, std::shared_ptr<Logger> logger = nullptr);

  // HEAD request only. Throws FetchFailure(ProbeFailed) on any network error
  // or a non-success final status.
  RemoteObjectMeta probe(const std::string& locator);

private:
  HttpClient& client_;
  std::shared_ptr<Logger> logger_;
};
