#pragma once

#include <xsc/curl_transport.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <ostream>
#include <string>

namespace xsc {

  struct cache_options {
    // Attribute of the document element holding the schema identifier
    std::string id_attribute = "id";
    http_options http;
    // Diagnostics sink; null silences warnings
    std::ostream* log = &std::cerr;
  };

  // Recognized keys:
  //   "id-attribute"            string
  //   "quiet"                   bool, drops diagnostics
  //   "http": {
  //     "timeout"               integer seconds
  //     "follow-redirects"      bool
  //     "user-agent"            string
  //   }
  // Unknown keys are ignored. A key of the wrong type throws
  // std::runtime_error naming it.
  cache_options
  cache_options_from_json(const nlohmann::json& config);

  // Reads a JSON configuration file. Throws io_error if the file cannot be
  // read and std::runtime_error if it is not valid JSON.
  cache_options
  load_cache_options(const std::string& path);

} // namespace xsc
