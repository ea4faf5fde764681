#include <xsc/directory_scanner.hpp>

#include <xsc/canonical_key.hpp>
#include <xsc/errors.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace xsc {

  std::vector<std::string>
  list_files(const std::string& root) {
    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
      throw io_error(root, ec ? ec.message() : "no such file or directory");
    }

    auto absolute = normalize_path(fs::absolute(root).string());
    if (fs::is_regular_file(status)) return {absolute};

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(
        absolute, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw io_error(root, ec.message());

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) throw io_error(root, ec.message());
      std::error_code type_ec;
      if (it->is_regular_file(type_ec)) files.push_back(it->path().string());
    }
    if (ec) throw io_error(root, ec.message());

    std::sort(files.begin(), files.end());
    return files;
  }

  timestamp
  file_mtime(const std::string& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) throw io_error(path, ec.message());
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::file_clock::to_sys(ftime));
  }

  std::string
  read_file(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) throw io_error(path, "is a directory");
    std::ifstream in(path, std::ios::binary);
    if (!in) throw io_error(path, "cannot open file");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw io_error(path, "read failed");
    return ss.str();
  }

} // namespace xsc
