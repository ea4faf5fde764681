#include <xsc/canonical_key.hpp>

#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace xsc {

  namespace {

    constexpr std::string_view file_prefix = "file://";

    // An empty path stays empty: it names no file.
    std::string
    absolute_path(const std::string& path) {
      if (path.empty()) return path;
      if (path[0] == '/') return normalize_path(path);
      std::error_code ec;
      auto absolute = fs::absolute(path, ec);
      if (ec) return normalize_path(path);
      return normalize_path(absolute.string());
    }

    // Split "scheme://authority/path?query" into (scheme://authority, path,
    // ?query). The path keeps its leading '/'.
    struct split_uri {
      std::string authority;
      std::string path;
      std::string suffix;
    };

    split_uri
    split_authority(const std::string& key, std::size_t scheme_end) {
      split_uri parts;
      auto path_start = key.find('/', scheme_end + 3);
      if (path_start == std::string::npos) {
        parts.authority = key;
        return parts;
      }
      parts.authority = key.substr(0, path_start);
      auto rest = key.substr(path_start);
      auto suffix_start = rest.find_first_of("?#");
      if (suffix_start != std::string::npos) {
        parts.suffix = rest.substr(suffix_start);
        rest.resize(suffix_start);
      }
      parts.path = std::move(rest);
      return parts;
    }

  } // namespace

  std::string
  normalize_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string component;
    auto flush = [&]() {
      if (component == "..") {
        if (!parts.empty()) parts.pop_back();
      } else if (component != "." && !component.empty()) {
        parts.push_back(component);
      }
      component.clear();
    };

    for (char c : path) {
      if (c == '/') {
        flush();
      } else {
        component += c;
      }
    }
    flush();

    std::string result;
    if (!path.empty() && path[0] == '/') result = "/";
    for (std::size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) result += "/";
      result += parts[i];
    }
    return result;
  }

  std::string_view
  uri_scheme(std::string_view key) {
    auto pos = key.find("://");
    if (pos == std::string_view::npos || pos == 0) return {};
    if (!std::isalpha(static_cast<unsigned char>(key[0]))) return {};
    for (std::size_t i = 1; i < pos; ++i) {
      auto c = static_cast<unsigned char>(key[i]);
      if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return {};
    }
    return key.substr(0, pos);
  }

  std::string
  file_path_of(std::string_view key) {
    if (key.starts_with(file_prefix)) key.remove_prefix(file_prefix.size());
    if (key.starts_with("localhost/")) key.remove_prefix(9);
    return std::string(key);
  }

  std::string
  canonical_key(const std::string& raw, std::string_view default_scheme) {
    if (raw.empty()) return raw;
    auto scheme = uri_scheme(raw);

    if (scheme == "file") {
      return std::string(file_prefix) + absolute_path(file_path_of(raw));
    }

    if (scheme == "http" || scheme == "https") {
      auto parts = split_authority(raw, scheme.size());
      if (parts.path.empty()) return raw;
      auto path = normalize_path(parts.path);
      // normalize_path drops a trailing separator; directory URLs keep it
      if (parts.path.size() > 1 && parts.path.back() == '/' && path != "/") {
        path += '/';
      }
      return parts.authority + path + parts.suffix;
    }

    if (!scheme.empty()) return raw;

    if (default_scheme == "file" || (!raw.empty() && raw[0] == '/')) {
      return std::string(file_prefix) + absolute_path(raw);
    }

    return raw;
  }

} // namespace xsc
