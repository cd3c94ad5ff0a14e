#include "typography_extractor.hpp"
#include "pdf_text_mapper.hpp"

#include <cmath>
#include <limits>

using namespace pdf_compliance;

int pdf_compliance::round_font_size(double size) {
  if (std::isnan(size)) return 0;
  double rounded = std::nearbyint(size);
  if (rounded >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
  if (rounded <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
  return static_cast<int>(rounded);
}

TypographyExtractor::TypographyExtractor(std::ostream& log) : m_log(log) {}

TypographyInfo TypographyExtractor::extract(const ByteBuffer& bytes) const {
  try {
    auto doc = DocumentHandle::open_memory("typography", bytes);
    return extract(*doc);
  } catch (const std::exception& e) {
    m_log << "pdf_compliance: typography: " << e.what() << std::endl;
    TypographyInfo empty;
    empty.diagnostic = e.what();
    return empty;
  }
}

TypographyInfo TypographyExtractor::extract(DocumentHandle& doc) const {
  TypographyInfo info;
  PDFTextMapper mapper(m_log);

  std::vector<QPDFPageObjectHelper> pages;
  try {
    pages = doc.pages();
  } catch (const std::exception& e) {
    m_log << "pdf_compliance: typography: cannot list pages: " << e.what() << std::endl;
    info.diagnostic = e.what();
    return info;
  }

  for (size_t i = 0; i < pages.size(); ++i) {
    try {
      PageText page = mapper.map(pages[i], static_cast<int>(i));
      for (const auto& run : page.runs) {
        info.font_sizes.insert(round_font_size(run.font_size));
        info.font_families.insert(run.font_family);
      }
    } catch (const std::exception& e) {
      m_log << "pdf_compliance: typography: page " << i + 1 << " skipped: " << e.what() << std::endl;
      info.diagnostic = "page " + std::to_string(i + 1) + ": " + e.what();
    }
  }

  return info;
}
