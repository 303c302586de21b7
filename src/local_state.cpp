#include "local_state.hpp"

#include <system_error>

#include "errors.hpp"

LocalFileState inspect_local_state(const std::filesystem::path& path) {
  LocalFileState state;
  state.path = path;

  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if(ec && status.type() != std::filesystem::file_type::not_found) {
    throw FetchFailure(FetchError::LocalStateUnavailable,
                       "Unable to stat " + path.string() + ": " + ec.message());
  }
  if(status.type() == std::filesystem::file_type::not_found) {
    return state;
  }
  if(!std::filesystem::is_regular_file(status)) {
    throw FetchFailure(FetchError::LocalStateUnavailable,
                       path.string() + " exists but is not a regular file");
  }

  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    throw FetchFailure(FetchError::LocalStateUnavailable,
                       "Unable to read size of " + path.string() + ": " + ec.message());
  }
  state.exists = true;
  state.size_bytes = static_cast<uint64_t>(size);
  return state;
}
