#pragma once

#include <xsc/uri_loader.hpp>

#include <string>

namespace xsc {

  struct http_options {
    // Whole-transfer timeout; 0 waits indefinitely
    long timeout_seconds = 30;
    bool follow_redirects = true;
    // Empty selects "xsc/<version>"
    std::string user_agent;
  };

  // libcurl-backed GET. The Last-Modified header is reported through
  // http_response::last_modified.
  http_transport
  curl_transport(const http_options& options = {});

} // namespace xsc
