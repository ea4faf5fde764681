#include <xsc/document_parser.hpp>

#include <xsc/errors.hpp>

#include <expat.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace xsc {

  namespace {

    // Parse "uri\nlocal" into a qname. Unqualified names have no separator.
    qname
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) { return qname{"", std::string(expat_name)}; }
      return qname{std::string(expat_name, sep), std::string(sep + 1)};
    }

    struct parser_deleter {
      void
      operator()(XML_Parser parser) const {
        XML_ParserFree(parser);
      }
    };

    using parser_ptr =
        std::unique_ptr<std::remove_pointer_t<XML_Parser>, parser_deleter>;

    struct tree_builder {
      struct frame {
        qname name;
        std::vector<attribute> attributes;
        std::vector<document::child> children;
      };

      std::vector<frame> open;
      document root;
      bool done = false;

      static void XMLCALL
      on_start_element(void* user_data, const char* name, const char** atts) {
        auto* self = static_cast<tree_builder*>(user_data);

        frame f;
        f.name = parse_expat_name(name);
        for (const char** p = atts; *p != nullptr; p += 2) {
          f.attributes.emplace_back(parse_expat_name(p[0]), std::string(p[1]));
        }
        self->open.push_back(std::move(f));
      }

      static void XMLCALL
      on_end_element(void* user_data, const char* /*name*/) {
        auto* self = static_cast<tree_builder*>(user_data);

        frame f = std::move(self->open.back());
        self->open.pop_back();
        document elem(std::move(f.name), std::move(f.attributes),
                      std::move(f.children));

        if (self->open.empty()) {
          self->root = std::move(elem);
          self->done = true;
        } else {
          self->open.back().children.emplace_back(std::move(elem));
        }
      }

      static void XMLCALL
      on_character_data(void* user_data, const char* s, int len) {
        auto* self = static_cast<tree_builder*>(user_data);
        if (self->open.empty()) return;

        auto& children = self->open.back().children;
        // Coalesce adjacent character data into a single text node
        if (!children.empty() &&
            std::holds_alternative<std::string>(children.back())) {
          std::get<std::string>(children.back())
              .append(s, static_cast<std::size_t>(len));
          return;
        }
        children.emplace_back(std::string(s, static_cast<std::size_t>(len)));
      }
    };

  } // namespace

  document
  parse_document(std::string_view xml) {
    return parse_document_in_chunks(xml, std::size_t{1} << 20);
  }

  document
  parse_document_in_chunks(std::string_view xml, std::size_t chunk_size) {
    // XML_Parse takes an int length
    chunk_size = std::clamp<std::size_t>(
        chunk_size, 1, static_cast<std::size_t>(std::numeric_limits<int>::max()));

    // '\n' as the namespace separator
    parser_ptr parser(XML_ParserCreateNS(nullptr, '\n'));
    if (!parser) { throw std::runtime_error("failed to create expat parser"); }

    tree_builder builder;
    XML_SetUserData(parser.get(), &builder);
    XML_SetElementHandler(parser.get(), tree_builder::on_start_element,
                          tree_builder::on_end_element);
    XML_SetCharacterDataHandler(parser.get(), tree_builder::on_character_data);

    std::size_t offset = 0;
    bool last = false;
    do {
      auto len = std::min(chunk_size, xml.size() - offset);
      last = offset + len == xml.size();
      XML_Status status =
          XML_Parse(parser.get(), xml.data() + offset, static_cast<int>(len),
                    last ? XML_TRUE : XML_FALSE);
      if (status == XML_STATUS_ERROR) {
        throw parse_error(
            static_cast<std::size_t>(XML_GetCurrentLineNumber(parser.get())),
            XML_ErrorString(XML_GetErrorCode(parser.get())));
      }
      offset += len;
    } while (!last);

    if (!builder.done) { throw parse_error(0, "no document element"); }
    return std::move(builder.root);
  }

} // namespace xsc
