#pragma once

#include <iostream>

#include "compliance_types.hpp"
#include "document_handle.hpp"

namespace pdf_compliance {

/**
 * Collects every distinct font size (rounded to whole points) and every distinct font name used
 * anywhere in the document.
 *
 * Never throws. A page that cannot be interpreted is skipped; a buffer that cannot be opened
 * gives two empty sets. Either way `diagnostic` says what went wrong.
 */
class TypographyExtractor {
 public:
  explicit TypographyExtractor(std::ostream& log = std::cerr);

  TypographyInfo extract(const ByteBuffer& bytes) const;
  TypographyInfo extract(DocumentHandle& doc) const;

 private:
  std::ostream& m_log;
};

/**
 * Round half to even, the way sizes like 10.5 are reported by most extraction tools.
 * Sizes beyond the int range saturate; NaN gives 0.
 */
int round_font_size(double size);

}  // namespace pdf_compliance
