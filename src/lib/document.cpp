#include <xsc/document.hpp>

#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace xsc {

  namespace {

    // Character data and attribute values share one escaper; only attribute
    // values need '"' replaced.
    void
    write_escaped(std::ostream& os, std::string_view text, bool in_attribute) {
      for (char c : text) {
        switch (c) {
          case '<':
            os << "&lt;";
            break;
          case '>':
            os << "&gt;";
            break;
          case '&':
            os << "&amp;";
            break;
          case '"':
            if (in_attribute) {
              os << "&quot;";
            } else {
              os << c;
            }
            break;
          default:
            os << c;
            break;
        }
      }
    }

    const std::string xml_ns = "http://www.w3.org/XML/1998/namespace";

    using uri_prefix_map = std::unordered_map<std::string, std::string>;

    void
    write_name(std::ostream& os, const qname& name,
               const uri_prefix_map& declared) {
      if (!name.namespace_uri().empty()) {
        os << declared.at(name.namespace_uri()) << ':';
      }
      os << name.local_name();
    }

    // `declared` is taken by value: bindings introduced on an element go out
    // of scope with it.
    void
    write_element(std::ostream& os, const document& elem,
                  uri_prefix_map declared, int& counter) {
      declared.emplace(xml_ns, "xml");
      std::vector<std::pair<std::string, std::string>> new_bindings;

      auto ensure = [&](const std::string& uri) {
        if (uri.empty() || declared.count(uri)) { return; }
        std::string pfx = "ns" + std::to_string(counter++);
        declared[uri] = pfx;
        new_bindings.emplace_back(pfx, uri);
      };

      ensure(elem.name().namespace_uri());
      for (const auto& attr : elem.attributes()) {
        ensure(attr.name().namespace_uri());
      }

      os << '<';
      write_name(os, elem.name(), declared);
      for (const auto& [pfx, uri] : new_bindings) {
        os << " xmlns:" << pfx << "=\"";
        write_escaped(os, uri, true);
        os << '"';
      }
      for (const auto& attr : elem.attributes()) {
        os << ' ';
        write_name(os, attr.name(), declared);
        os << "=\"";
        write_escaped(os, attr.value(), true);
        os << '"';
      }

      if (elem.children().empty()) {
        os << "/>";
        return;
      }
      os << '>';

      for (const auto& child : elem.children()) {
        std::visit(
            [&](const auto& v) {
              using T = std::decay_t<decltype(v)>;
              if constexpr (std::is_same_v<T, std::string>) {
                write_escaped(os, v, false);
              } else {
                write_element(os, v, declared, counter);
              }
            },
            child);
      }

      os << "</";
      write_name(os, elem.name(), declared);
      os << '>';
    }

  } // namespace

  const std::string*
  document::find_attribute(std::string_view local_name) const {
    for (const auto& attr : attributes_) {
      if (attr.name().namespace_uri().empty() &&
          attr.name().local_name() == local_name) {
        return &attr.value();
      }
    }
    return nullptr;
  }

  void
  document::set_attribute(std::string_view local_name, std::string value) {
    for (auto& attr : attributes_) {
      if (attr.name().namespace_uri().empty() &&
          attr.name().local_name() == local_name) {
        attr.set_value(std::move(value));
        return;
      }
    }
    attributes_.emplace_back(qname{"", std::string(local_name)},
                             std::move(value));
  }

  std::optional<std::string>
  schema_id(const document& schema, std::string_view id_attribute) {
    const std::string* id = schema.find_attribute(id_attribute);
    if (id == nullptr || id->empty()) return std::nullopt;
    return *id;
  }

  void
  ensure_schema_id(document& schema, const std::string& source_key,
                   std::string_view id_attribute) {
    if (schema_id(schema, id_attribute)) return;
    schema.set_attribute(id_attribute, source_key);
  }

  bool
  is_document_container(const document& schema) {
    return !schema.empty();
  }

  void
  write_xml(std::ostream& os, const document& schema) {
    int counter = 0;
    write_element(os, schema, {}, counter);
  }

} // namespace xsc
