#include "margin_extractor.hpp"

#include <algorithm>

using namespace pdf_compliance;

Margins pdf_compliance::margins_from_chars(const std::vector<CharBox>& chars, const PageGeometry& geometry) {
  Margins m;
  if (chars.empty()) return m;

  double min_x = chars.front().x0;
  double max_x = chars.front().x1;
  double min_y = chars.front().top;
  double max_y = chars.front().bottom;
  for (const auto& c : chars) {
    min_x = std::min(min_x, c.x0);
    max_x = std::max(max_x, c.x1);
    min_y = std::min(min_y, c.top);
    max_y = std::max(max_y, c.bottom);
  }

  m.left = min_x / POINTS_PER_INCH;
  m.right = (geometry.width - max_x) / POINTS_PER_INCH;
  m.top = min_y / POINTS_PER_INCH;
  m.bottom = (geometry.height - max_y) / POINTS_PER_INCH;
  return m;
}

MarginExtractor::MarginExtractor(std::ostream& log) : m_log(log) {}

MarginInfo MarginExtractor::extract(const ByteBuffer& bytes) const {
  try {
    auto doc = DocumentHandle::open_memory("margins", bytes);
    return extract(*doc);
  } catch (const std::exception& e) {
    m_log << "pdf_compliance: margins: " << e.what() << std::endl;
    MarginInfo zero;
    zero.diagnostic = e.what();
    return zero;
  }
}

MarginInfo MarginExtractor::extract(DocumentHandle& doc) const {
  MarginInfo info;
  try {
    std::vector<QPDFPageObjectHelper> pages = doc.pages();
    if (pages.empty()) {
      info.diagnostic = "document has no pages";
      return info;
    }

    PDFTextMapper mapper(m_log);
    PageText first = mapper.map(pages.front(), 0);
    if (first.chars.empty()) {
      info.diagnostic = "no characters on page 1";
      return info;
    }
    info.margins = margins_from_chars(first.chars, first.geometry);
  } catch (const std::exception& e) {
    m_log << "pdf_compliance: margins: page 1 unreadable: " << e.what() << std::endl;
    info.margins = Margins{};
    info.diagnostic = e.what();
  }
  return info;
}
