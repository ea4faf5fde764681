#pragma once

#include <xsc/cache_types.hpp>

#include <string>
#include <vector>

namespace xsc {

  // Recursively lists the regular files under `root` as absolute, normalized
  // paths in lexical order. A `root` naming a regular file yields just that
  // file. Throws io_error when `root` does not exist or cannot be walked.
  std::vector<std::string>
  list_files(const std::string& root);

  // Throws io_error when the file cannot be stat'ed.
  timestamp
  file_mtime(const std::string& path);

  // Throws io_error when the file cannot be read.
  std::string
  read_file(const std::string& path);

} // namespace xsc
