#include <xsc/schema_cache.hpp>

#include <xsc/canonical_key.hpp>
#include <xsc/curl_transport.hpp>
#include <xsc/directory_scanner.hpp>
#include <xsc/errors.hpp>

#include <exception>
#include <mutex>
#include <utility>

namespace xsc {

  schema_cache::schema_cache(cache_options options)
      : options_(std::move(options)),
        loader_(curl_transport(options_.http), options_.id_attribute) {}

  schema_cache::schema_cache(cache_options options, http_transport transport)
      : options_(std::move(options)),
        loader_(std::move(transport), options_.id_attribute) {}

  const schema_store*
  schema_cache::existing_table() const {
    if (!table_created_.load(std::memory_order_acquire)) return nullptr;
    return table_.get();
  }

  bool
  schema_cache::has_table() const {
    return existing_table() != nullptr;
  }

  schema_store&
  schema_cache::ensure_table() {
    std::call_once(table_once_, [this] {
      table_ = std::make_unique<schema_store>();
      table_created_.store(true, std::memory_order_release);
    });
    return *table_;
  }

  void
  schema_cache::warn(const std::string& message) const {
    if (options_.log == nullptr) return;
    std::lock_guard lock(log_mutex_);
    *options_.log << "xsc: warning: " << message << "\n";
  }

  store_result
  schema_cache::admit(std::vector<schema_candidate> candidates,
                      const validate_fn& validate) {
    store_result failures;

    for (auto& candidate : candidates) {
      if (!candidate.schema) {
        failures.push_back({std::move(candidate.source_key), candidate.mtime,
                            candidate.error.empty() ? "no document"
                                                    : candidate.error});
        continue;
      }

      bool valid = false;
      try {
        valid = validate ? validate(*candidate.schema)
                         : is_document_container(*candidate.schema);
      } catch (const std::exception& e) {
        failures.push_back({std::move(candidate.source_key), candidate.mtime,
                            std::string("validation failed: ") + e.what()});
        continue;
      }
      if (!valid) {
        failures.push_back({std::move(candidate.source_key), candidate.mtime,
                            "validation rejected"});
        continue;
      }

      cache_row row;
      row.source_key = std::move(candidate.source_key);
      row.id_key = schema_id(*candidate.schema, options_.id_attribute);
      row.mtime = candidate.mtime;
      row.schema =
          std::make_shared<const document>(std::move(*candidate.schema));
      ensure_table().insert(std::move(row));
    }

    return failures;
  }

  store_result
  schema_cache::add(const std::string& key, document schema,
                    const validate_fn& validate) {
    std::vector<schema_candidate> candidates;
    candidates.push_back(
        {canonical_key(key), timestamp{}, std::move(schema), {}});
    return admit(std::move(candidates), validate);
  }

  store_result
  schema_cache::add_uri(const std::string& key) {
    std::vector<schema_candidate> candidates;
    candidates.push_back(loader_.load(canonical_key(key)));
    auto failures = admit(std::move(candidates), is_document_container);
    for (const auto& f : failures) {
      warn(f.source_key + ": " + f.reason);
    }
    return failures;
  }

  bool
  schema_cache::is_outdated(const std::string& file_path) const {
    const auto* table = existing_table();
    if (table == nullptr) return true;

    auto row = table->find_by_source("file://" + file_path);
    if (!row) return true;
    // Rows without a modification time are never refreshed
    if (row->mtime == timestamp{}) return false;

    try {
      return file_mtime(file_path) > row->mtime;
    } catch (const io_error&) {
      // Gone or unreadable: let the load report it
      return true;
    }
  }

  std::vector<std::string>
  schema_cache::list_outdated(const std::string& path) const {
    auto files = list_files(path);
    if (files.empty() || !has_table()) return files;

    std::vector<std::string> outdated;
    for (auto& file : files) {
      if (is_outdated(file)) outdated.push_back(std::move(file));
    }
    return outdated;
  }

  store_result
  schema_cache::add_path(const std::string& path, const parse_fn& parse,
                         const validate_fn& validate) {
    auto root = file_path_of(canonical_key(path, "file"));

    std::vector<schema_candidate> candidates;
    for (const auto& file : list_outdated(root)) {
      schema_candidate candidate;
      candidate.source_key = "file://" + file;
      try {
        candidate.mtime = file_mtime(file);
        auto content = read_file(file);
        document schema = parse ? parse(content) : parse_document(content);
        ensure_schema_id(schema, candidate.source_key, options_.id_attribute);
        candidate.schema = std::move(schema);
      } catch (const std::exception& e) {
        candidate.error = e.what();
      }
      candidates.push_back(std::move(candidate));
    }

    auto failures = admit(std::move(candidates), validate);
    for (const auto& f : failures) {
      warn(f.source_key + ": " + f.reason);
    }
    return failures;
  }

  std::shared_ptr<const document>
  schema_cache::find(const std::string& key) const {
    const auto* table = existing_table();
    if (table == nullptr) return nullptr;

    auto canonical = canonical_key(key);
    if (auto row = table->find_by_source(canonical)) return row->schema;
    if (auto row = table->find_by_id(canonical)) return row->schema;
    // Declared identifiers are stored verbatim
    if (canonical != key) {
      if (auto row = table->find_by_id(key)) return row->schema;
    }
    return nullptr;
  }

  std::shared_ptr<const document>
  schema_cache::load(const std::string& key) const {
    auto schema = find(key);
    if (!schema) throw schema_not_found(canonical_key(key));
    return schema;
  }

  std::shared_ptr<const document>
  schema_cache::load_uri(const std::string& key) {
    if (auto schema = find(key)) return schema;
    // Rejections are logged by add_uri; the second lookup reports the miss
    add_uri(key);
    return load(key);
  }

  std::vector<cache_row>
  schema_cache::load_all() const {
    const auto* table = existing_table();
    if (table == nullptr) return {};
    return table->rows();
  }

  void
  schema_cache::remove(const std::string& key) {
    if (!has_table()) return;

    auto& table = ensure_table();
    auto canonical = canonical_key(key);
    table.erase_by_source(canonical);
    table.erase_by_id(canonical);
    if (canonical != key) table.erase_by_id(key);
  }

} // namespace xsc
