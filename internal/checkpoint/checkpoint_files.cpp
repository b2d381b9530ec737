#include "internal/checkpoint/checkpoint_files.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::checkpoint {

namespace {

template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

void ValidateId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("checkpoint id must not be empty");
  }
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("checkpoint id contains invalid character");
    }
  }
  if (id == "." || id == "..") {
    throw util::InvalidArgument("checkpoint id must not be a relative path component");
  }
}

} // namespace

CheckpointFiles::CheckpointFiles(const std::string& directory, bool fsync) : fsync_(fsync) {
  if (directory.empty()) {
    throw util::InvalidArgument("checkpoint directory must not be empty");
  }
  fs_ = Unwrap(arrow::fs::FileSystemFromUriOrPath(directory, &root_));
  while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
  Unwrap(fs_->CreateDir(root_, /*recursive=*/true));
}

std::string CheckpointFiles::PathFor(const std::string& id, std::string_view extension) const {
  ValidateId(id);
  return root_ + "/" + id + std::string(extension);
}

void CheckpointFiles::WriteNew(const std::string& path, std::string_view bytes) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::NotFound) {
    throw util::AlreadyExists("checkpoint file already exists: " + path);
  }

  const auto tmp_path = path + ".tmp";
  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));

    if (fsync_) Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  Unwrap(fs_->Move(tmp_path, path));
}

std::optional<std::string> CheckpointFiles::Read(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) return std::nullopt;

  auto file   = Unwrap(fs_->OpenInputFile(path));
  auto size   = Unwrap(file->GetSize());
  auto buffer = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return buffer->ToString();
}

std::optional<uint64_t> CheckpointFiles::Size(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) return std::nullopt;
  return static_cast<uint64_t>(info.size());
}

bool CheckpointFiles::Remove(const std::string& path) {
  auto info = fs_->GetFileInfo(path);
  if (!info.ok()) {
    JOBGUARD_LOG_WARN("checkpoint file stat failed", {observability::StringField("path", path), observability::StringField("error", info.status().ToString())});
    return false;
  }
  if (info->type() == arrow::fs::FileType::NotFound) return true;

  auto status = fs_->DeleteFile(path);
  if (!status.ok()) {
    JOBGUARD_LOG_WARN("checkpoint file delete failed", {observability::StringField("path", path), observability::StringField("error", status.ToString())});
    return false;
  }
  return true;
}

} // namespace jobguard::checkpoint
