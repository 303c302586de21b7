#include "remote_probe.hpp"

#include "errors.hpp"

RemoteProbe::RemoteProbe(HttpClient& client, std::shared_ptr<Logger> logger)
  : client_(client), logger_(std::move(logger)) {}

RemoteObjectMeta RemoteProbe::probe(const std::string& locator) {
  HttpResponseHead head;
  try {
    head = client_.head(locator);
  } catch(const HttpError& e) {
    throw FetchFailure(FetchError::ProbeFailed,
                       std::string("Probe of ") + locator + " failed (" +
                       http_error_label(e.kind()) + "): " + e.what());
  }
  if(!head.is_success()) {
    throw FetchFailure(FetchError::ProbeFailed,
                       "Probe of " + locator + " returned HTTP " +
                       std::to_string(head.status) + " " + head.reason);
  }

  RemoteObjectMeta meta;
  meta.total_size_bytes = head.content_length.value_or(0);
  meta.accepts_ranges = head.accept_ranges;
  log_debug(logger_.get(), "Probe {}: size={} ranges={}", locator,
            meta.total_size_bytes, meta.accepts_ranges ? "bytes" : "none");
  return meta;
}
