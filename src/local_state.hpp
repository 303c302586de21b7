#pragma once

#include <cstdint>
#include <filesystem>

struct LocalFileState {
  std::filesystem::path path;
  bool exists = false;
  uint64_t size_bytes = 0;
};

// Stats the target path. Absence is a normal result; anything the filesystem
// refuses to answer throws FetchFailure(LocalStateUnavailable).
LocalFileState inspect_local_state(const std::filesystem::path& path);
