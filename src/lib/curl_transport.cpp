#include <xsc/curl_transport.hpp>

#include <xsc/errors.hpp>

#include <curl/curl.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace xsc {

  namespace {

    std::size_t
    xsc_curl_write_cb(char* ptr, std::size_t size, std::size_t nmemb,
                      void* userdata) {
      auto* buf = static_cast<std::string*>(userdata);
      buf->append(ptr, size * nmemb);
      return size * nmemb;
    }

    struct curl_deleter {
      void
      operator()(CURL* curl) const {
        curl_easy_cleanup(curl);
      }
    };

    // curl_global_init is not thread-safe; run it once before any handle is
    // created.
    void
    init_curl_once() {
      static std::once_flag once;
      std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
          throw std::runtime_error("curl_global_init failed");
        }
      });
    }

    http_response
    curl_get(const std::string& url, const http_options& options) {
      std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
      if (!curl) throw network_error(url, "curl_easy_init failed");

      std::string user_agent = options.user_agent.empty()
                                   ? std::string("xsc/") + XSC_VERSION
                                   : options.user_agent;

      http_response response;
      curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, xsc_curl_write_cb);
      curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
      curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION,
                       options.follow_redirects ? 1L : 0L);
      curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);
      curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
      // Have curl parse Last-Modified for us
      curl_easy_setopt(curl.get(), CURLOPT_FILETIME, 1L);

      CURLcode res = curl_easy_perform(curl.get());
      if (res != CURLE_OK) throw network_error(url, curl_easy_strerror(res));

      curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

      curl_off_t filetime = -1;
      if (curl_easy_getinfo(curl.get(), CURLINFO_FILETIME_T, &filetime) ==
              CURLE_OK &&
          filetime > 0) {
        response.last_modified = timestamp{std::chrono::seconds{filetime}};
      }

      return response;
    }

  } // namespace

  http_transport
  curl_transport(const http_options& options) {
    init_curl_once();
    return [options](const std::string& url) { return curl_get(url, options); };
  }

} // namespace xsc
