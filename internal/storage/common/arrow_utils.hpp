#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "internal/util/errors.hpp"

namespace graphflow::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::PersistenceError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::PersistenceError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::PersistenceError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

// Copies text into an owned Arrow buffer.
std::shared_ptr<arrow::Buffer> BufferFromString(std::string_view text);

std::string BufferToString(const std::shared_ptr<arrow::Buffer>& buffer);

/*
  Resolve a URI or local path into (filesystem, path-within-filesystem).

  Plain paths map to the local filesystem; s3://, gs://, abfs:// and
  hdfs:// go through Arrow's registered filesystem factories.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path);

} // namespace graphflow::storage::common
