#include <xsc/cache_config.hpp>

#include <xsc/directory_scanner.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace xsc {

  namespace {

    template <typename T>
    T
    value_of(const nlohmann::json& object, const std::string& key, T fallback) {
      try {
        return object.value(key, std::move(fallback));
      } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("config: invalid value for '" + key +
                                 "': " + e.what());
      }
    }

  } // namespace

  cache_options
  cache_options_from_json(const nlohmann::json& config) {
    if (!config.is_object()) {
      throw std::runtime_error("config: top level must be an object");
    }

    cache_options opts;
    opts.id_attribute = value_of(config, "id-attribute", opts.id_attribute);
    if (opts.id_attribute.empty()) {
      throw std::runtime_error("config: 'id-attribute' must not be empty");
    }
    if (value_of(config, "quiet", false)) opts.log = nullptr;

    if (config.contains("http")) {
      const auto& http = config.at("http");
      if (!http.is_object()) {
        throw std::runtime_error("config: 'http' must be an object");
      }
      opts.http.timeout_seconds =
          value_of(http, "timeout", opts.http.timeout_seconds);
      if (opts.http.timeout_seconds < 0) {
        throw std::runtime_error("config: 'timeout' must not be negative");
      }
      opts.http.follow_redirects =
          value_of(http, "follow-redirects", opts.http.follow_redirects);
      opts.http.user_agent =
          value_of(http, "user-agent", opts.http.user_agent);
    }

    return opts;
  }

  cache_options
  load_cache_options(const std::string& path) {
    auto text = read_file(path);
    nlohmann::json config;
    try {
      config = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("config: " + path + ": " + e.what());
    }
    return cache_options_from_json(config);
  }

} // namespace xsc
