#pragma once

#include <string>
#include <string_view>

namespace xsc {

  // Normalizes a caller-supplied key or path into the form rows are stored
  // under:
  //   file://<path>       path made absolute, "." and ".." resolved
  //   http(s)://host/path path normalized, authority kept as-is
  //   /abs/path           becomes file:///abs/path
  //   rel/path            becomes file://<cwd>/rel/path when default_scheme
  //                       is "file", otherwise left unchanged
  // Keys with any other scheme, and opaque names, are returned unchanged.
  // An empty key stays empty and a bare "file://" stays "file://".
  std::string
  canonical_key(const std::string& raw, std::string_view default_scheme = {});

  // Scheme of a "scheme://..." key, or empty when it has none.
  std::string_view
  uri_scheme(std::string_view key);

  // Filesystem path of a file:// key.
  std::string
  file_path_of(std::string_view key);

  // Resolve "." and ".." components and collapse repeated separators.
  std::string
  normalize_path(const std::string& path);

} // namespace xsc
