#include "transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <optional>

#include "errors.hpp"

const char* transfer_mode_label(TransferMode::Kind kind) {
  switch(kind) {
    case TransferMode::Kind::Skip: return "Skip";
    case TransferMode::Kind::ResumeFrom: return "ResumeFrom";
    case TransferMode::Kind::FreshStart: return "FreshStart";
  }
  return "Unknown";
}

std::string describe(const TransferMode& mode) {
  if(mode.kind == TransferMode::Kind::ResumeFrom) {
    return std::string("ResumeFrom(") + std::to_string(mode.offset) + ")";
  }
  return transfer_mode_label(mode.kind);
}

TransferEngine::TransferEngine(HttpClient& client, std::shared_ptr<Logger> logger)
  : client_(client), logger_(std::move(logger)) {}

TransferResult TransferEngine::transfer(const std::string& locator,
                                        const std::filesystem::path& target,
                                        const TransferMode& mode,
                                        const ProgressCallback& progress) {
  TransferResult result;
  if(mode.kind == TransferMode::Kind::Skip) return result;
  result.performed = true;

  const bool resuming = mode.kind == TransferMode::Kind::ResumeFrom;
  const uint64_t offset = resuming ? mode.offset : 0;

  std::ofstream out;
  uint64_t discard = 0;                 // leading body bytes already on disk
  std::optional<uint64_t> write_limit;  // bytes this response may add to the file
  bool drop_body = false;

  auto on_head = [&](const HttpResponseHead& head) {
    result.http_status = head.status;

    if(resuming && head.status == 416) {
      result.already_complete = true;
      drop_body = true;
      return;
    }
    if(!head.is_success()) {
      throw FetchFailure(FetchError::TransferInterrupted,
                         "GET " + locator + " returned HTTP " + std::to_string(head.status) +
                         " " + head.reason);
    }

    if(resuming && head.status == 206) {
      if(!head.content_range || head.content_range->first != offset) {
        throw FetchFailure(FetchError::TransferInterrupted,
                           "Server answered the range request for " + locator +
                           " with a different range");
      }
      write_limit = head.content_range->last - head.content_range->first + 1;
      if(head.content_length) write_limit = std::min(*write_limit, *head.content_length);
      result.expected_total = head.content_range->complete_length.value_or(offset + *write_limit);
    } else if(resuming) {
      // full body despite the Range header: skip what is already on disk
      result.range_ignored = true;
      discard = offset;
      if(head.content_length) {
        if(*head.content_length < offset) {
          throw FetchFailure(FetchError::TransferInterrupted,
                             "Remote body of " + locator + " is shorter than the local file");
        }
        write_limit = *head.content_length - offset;
        result.expected_total = *head.content_length;
      }
      log_warn(logger_.get(), "{} ignored the range request, skipping {} bytes of the body",
               head.final_url, offset);
    } else {
      if(head.status == 206) {
        throw FetchFailure(FetchError::TransferInterrupted,
                           "Unrequested partial content for " + locator);
      }
      write_limit = head.content_length;
      result.expected_total = head.content_length.value_or(0);
    }

    auto flags = std::ios::binary | std::ios::out | (resuming ? std::ios::app : std::ios::trunc);
    out.open(target, flags);
    if(!out) {
      throw FetchFailure(FetchError::LocalStateUnavailable,
                         "Unable to open " + target.string() + " for writing");
    }
    if(progress) progress(offset, result.expected_total);
  };

  auto on_body = [&](const char* data, std::size_t size) -> bool {
    if(drop_body) return false;
    if(discard > 0) {
      auto skipped = static_cast<std::size_t>(std::min<uint64_t>(discard, size));
      discard -= skipped;
      data += skipped;
      size -= skipped;
      if(size == 0) return true;
    }
    bool more = true;
    if(write_limit) {
      uint64_t room = *write_limit - result.bytes_written;
      if(size > room) {
        log_warn(logger_.get(), "{} sent more than its declared length, truncating the excess", locator);
        size = static_cast<std::size_t>(room);
        more = false;
      }
    }
    if(size > 0) {
      out.write(data, static_cast<std::streamsize>(size));
      out.flush();
      if(!out) {
        throw FetchFailure(FetchError::LocalStateUnavailable,
                           "Write to " + target.string() + " failed");
      }
      result.bytes_written += size;
      if(progress) progress(offset + result.bytes_written, result.expected_total);
    }
    return more && !(write_limit && result.bytes_written >= *write_limit);
  };

  try {
    client_.get(locator, resuming ? std::optional<uint64_t>(offset) : std::nullopt, on_head, on_body);
  } catch(const HttpError& e) {
    throw FetchFailure(FetchError::TransferInterrupted,
                       std::string("Transfer of ") + locator + " interrupted after " +
                       std::to_string(result.bytes_written) + " bytes (" +
                       http_error_label(e.kind()) + "): " + e.what());
  }

  if(write_limit && result.bytes_written < *write_limit) {
    throw FetchFailure(FetchError::TransferInterrupted,
                       "Transfer of " + locator + " ended after " +
                       std::to_string(result.bytes_written) + " of " +
                       std::to_string(*write_limit) + " bytes");
  }
  log_debug(logger_.get(), "{} {}: wrote {} bytes to {}", describe(mode), locator,
            result.bytes_written, target.string());
  return result;
}
