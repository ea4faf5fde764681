#pragma once

#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xsc {

  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;
  };

  class attribute {
    qname name_;
    std::string value_;

  public:
    attribute() = default;

    attribute(qname name, std::string value)
        : name_(std::move(name)), value_(std::move(value)) {}

    const qname&
    name() const {
      return name_;
    }

    const std::string&
    value() const {
      return value_;
    }

    void
    set_value(std::string value) {
      value_ = std::move(value);
    }

    bool
    operator==(const attribute&) const = default;
  };

  // A parsed schema: the document element together with its subtree.
  // Character data is kept as-is, including whitespace between elements.
  class document {
    qname name_;
    std::vector<attribute> attributes_;
    std::vector<std::variant<std::string, document>> children_;

  public:
    using child = std::variant<std::string, document>;

    document() = default;

    explicit document(qname name, std::vector<attribute> attributes = {},
                      std::vector<child> children = {})
        : name_(std::move(name)), attributes_(std::move(attributes)),
          children_(std::move(children)) {}

    const qname&
    name() const {
      return name_;
    }

    const std::vector<attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<child>&
    children() const {
      return children_;
    }

    bool
    empty() const {
      return name_.local_name().empty();
    }

    // Looks up an unqualified attribute of this element.
    const std::string*
    find_attribute(std::string_view local_name) const;

    // Replaces the value of an unqualified attribute, or appends it.
    void
    set_attribute(std::string_view local_name, std::string value);

    void
    append_child(child c) {
      children_.push_back(std::move(c));
    }

    bool
    operator==(const document&) const;
  };

  // Compares children through variant<std::string, document>::operator==,
  // which needs the complete document type.
  inline bool
  document::operator==(const document& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           children_ == other.children_;
  }

  // Value of the declared identifier attribute on the document element, if
  // present and non-empty.
  std::optional<std::string>
  schema_id(const document& schema, std::string_view id_attribute = "id");

  // Sets the identifier attribute to `source_key` when the document element
  // does not declare one.
  void
  ensure_schema_id(document& schema, const std::string& source_key,
                   std::string_view id_attribute = "id");

  // Admission check used for URI loads: the document has an element root.
  bool
  is_document_container(const document& schema);

  // Serializes as XML. Namespaces are declared on first use with generated
  // prefixes (ns0, ns1, ...).
  void
  write_xml(std::ostream& os, const document& schema);

} // namespace xsc
