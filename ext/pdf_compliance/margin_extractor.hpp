#pragma once

#include <iostream>

#include "compliance_types.hpp"
#include "document_handle.hpp"
#include "pdf_text_mapper.hpp"

namespace pdf_compliance {

constexpr double POINTS_PER_INCH = 72.0;

/**
 * Measures the margins of the first page from the bounding box of all its glyphs.
 *
 * Only page 1 is sampled. No glyphs, or any failure, gives all-zero margins.
 */
class MarginExtractor {
 public:
  explicit MarginExtractor(std::ostream& log = std::cerr);

  MarginInfo extract(const ByteBuffer& bytes) const;
  MarginInfo extract(DocumentHandle& doc) const;

 private:
  std::ostream& m_log;
};

/** Margins in inches of the box enclosing `chars` on a page of the given size. Zero when empty. */
Margins margins_from_chars(const std::vector<CharBox>& chars, const PageGeometry& geometry);

}  // namespace pdf_compliance
