#pragma once

#include <arrow/filesystem/filesystem.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace jobguard::checkpoint {

/*
  Write-once payload files under one directory, accessed through the
  Arrow filesystem layer (local path or any URI Arrow resolves).

  Writes go to "<file>.tmp", are flushed, then renamed into place. An
  existing file is never overwritten. Filesystem failures throw
  util::StorageError.
*/
class CheckpointFiles {
 public:
  CheckpointFiles(const std::string& directory, bool fsync);

  // Rejects ids that could escape the directory.
  std::string PathFor(const std::string& id, std::string_view extension) const;

  // Throws util::AlreadyExists if the file exists.
  void WriteNew(const std::string& path, std::string_view bytes);

  // nullopt when the file does not exist.
  std::optional<std::string> Read(const std::string& path);
  std::optional<uint64_t>    Size(const std::string& path);

  // True once the file is gone (deleted now or already missing). Logs and
  // returns false when the delete failed.
  bool Remove(const std::string& path);

  const std::string& Root() const {
    return root_;
  }

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
  bool                                   fsync_;
};

} // namespace jobguard::checkpoint
