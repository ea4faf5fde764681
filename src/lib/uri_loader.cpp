#include <xsc/uri_loader.hpp>

#include <xsc/canonical_key.hpp>
#include <xsc/directory_scanner.hpp>
#include <xsc/document_parser.hpp>
#include <xsc/errors.hpp>

#include <utility>

namespace xsc {

  uri_loader::uri_loader(http_transport transport, std::string id_attribute)
      : transport_(std::move(transport)), id_attribute_(std::move(id_attribute)) {}

  fetched_schema
  uri_loader::fetch(const std::string& source_key) const {
    auto scheme = uri_scheme(source_key);

    if (scheme == "file") {
      auto path = file_path_of(source_key);
      try {
        auto mtime = file_mtime(path);
        return {source_key, mtime, read_file(path)};
      } catch (const io_error& e) {
        throw io_error(source_key, e.detail());
      }
    }

    if (scheme == "http" || scheme == "https") {
      if (!transport_) {
        throw network_error(source_key, "no HTTP transport configured");
      }
      auto response = transport_(source_key);
      if (response.status != 200) {
        throw network_error(source_key, response.status);
      }
      return {source_key, response.last_modified.value_or(timestamp{}),
              std::move(response.body)};
    }

    throw unknown_uri_scheme(source_key);
  }

  schema_candidate
  uri_loader::load(const std::string& source_key) const {
    auto fetched = fetch(source_key);

    document schema;
    try {
      schema = parse_document(fetched.content);
    } catch (const parse_error& e) {
      throw parse_error(source_key, e.line(), e.detail());
    }
    ensure_schema_id(schema, source_key, id_attribute_);

    return {source_key, fetched.mtime, std::move(schema), {}};
  }

} // namespace xsc
