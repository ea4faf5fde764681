#pragma once

#include <xsc/cache_config.hpp>
#include <xsc/cache_types.hpp>
#include <xsc/document.hpp>
#include <xsc/document_parser.hpp>
#include <xsc/schema_store.hpp>
#include <xsc/uri_loader.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace xsc {

  using parse_fn = std::function<document(std::string_view)>;
  using validate_fn = std::function<bool(const document&)>;

  // Cache of schema documents addressable by the key they were loaded from
  // and by the identifier they declare.
  //
  // File-backed rows remember the file's modification time; add_path only
  // re-reads files whose mtime has moved past the stored one. Rows added
  // with add() carry timestamp{} and are never refreshed by add_path.
  //
  // All operations may be called concurrently. Two admissions of the same
  // source key race; the last insert wins.
  class schema_cache {
    cache_options options_;
    uri_loader loader_;

    std::once_flag table_once_;
    std::unique_ptr<schema_store> table_;
    std::atomic<bool> table_created_{false};

    // Serializes writes to options_.log
    mutable std::mutex log_mutex_;

    const schema_store*
    existing_table() const;

    void
    warn(const std::string& message) const;

  public:
    explicit schema_cache(cache_options options = {});

    // Uses `transport` for http:// and https:// keys instead of libcurl.
    schema_cache(cache_options options, http_transport transport);

    schema_cache(const schema_cache&) = delete;
    schema_cache&
    operator=(const schema_cache&) = delete;

    const cache_options&
    options() const {
      return options_;
    }

    // Adds `schema` under `key`, replacing any row with the same key. The
    // row has no modification time.
    store_result
    add(const std::string& key, document schema,
        const validate_fn& validate = is_document_container);

    // Fetches `key` (file://, http:// or https://) and adds it. Fetch and
    // parse failures are thrown; a rejected document is reported in the
    // result.
    store_result
    add_uri(const std::string& key);

    // Loads every file under `path` whose cached copy is missing or older
    // than the file. Unreadable, unparseable and rejected files are
    // reported in the result and do not stop the rest of the batch.
    store_result
    add_path(const std::string& path, const parse_fn& parse = parse_document,
             const validate_fn& validate = is_document_container);

    // Looks `key` up as a source key, then as an identifier. Throws
    // schema_not_found when neither matches.
    std::shared_ptr<const document>
    load(const std::string& key) const;

    // As load(), returning null on a miss.
    std::shared_ptr<const document>
    find(const std::string& key) const;

    // As load(), but on a miss fetches `key` with add_uri() once and looks
    // it up again.
    std::shared_ptr<const document>
    load_uri(const std::string& key);

    std::vector<cache_row>
    load_all() const;

    // Removes the rows matching `key` as a source key or as an identifier.
    void
    remove(const std::string& key);

    // Validates each candidate in order and inserts the valid ones.
    store_result
    admit(std::vector<schema_candidate> candidates,
          const validate_fn& validate);

    // True when `file_path` has no cached row or the file is newer than it.
    bool
    is_outdated(const std::string& file_path) const;

    // Files under `path` that need loading. Before the table exists every
    // file does.
    std::vector<std::string>
    list_outdated(const std::string& path) const;

    bool
    has_table() const;

    schema_store&
    ensure_table();
  };

} // namespace xsc
