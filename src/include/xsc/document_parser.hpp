#pragma once

#include <xsc/document.hpp>

#include <cstddef>
#include <string_view>

namespace xsc {

  // Parses a namespace-aware XML document. Element and attribute names carry
  // their resolved namespace URI; namespace declarations themselves are not
  // kept as attributes. Throws parse_error on malformed input.
  document
  parse_document(std::string_view xml);

  // As parse_document, handing expat at most `chunk_size` bytes per call, so
  // inputs beyond the range of int are parsed whole.
  document
  parse_document_in_chunks(std::string_view xml, std::size_t chunk_size);

} // namespace xsc
