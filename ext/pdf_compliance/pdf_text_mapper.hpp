#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <array>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace pdf_compliance {

using Matrix = std::array<double, 6>;

/** One shown string: a contiguous piece of text in one font at one size. */
struct TextRun {
  std::string font_family;
  double font_size = 0;  // effective size after text and graphics transforms
  int page_index = 0;
  size_t glyph_count = 0;
};

/** Glyph box in top-origin page coordinates, points. */
struct CharBox {
  double x0 = 0;
  double x1 = 0;
  double top = 0;
  double bottom = 0;
};

struct PageGeometry {
  double width = 0;
  double height = 0;
};

struct PageText {
  int page_index = 0;
  PageGeometry geometry;
  std::vector<TextRun> runs;
  std::vector<CharBox> chars;

  std::string to_string() const {
    std::ostringstream oss;
    oss << "PageText(page=" << page_index << ", width=" << geometry.width << ", height=" << geometry.height
        << ", runs=" << runs.size() << ", chars=" << chars.size() << ")";
    return oss.str();
  }
};

/** Page box with inheritance through /Parent, normalised to [llx, lly, urx, ury]. */
std::array<double, 4> page_media_box(QPDFObjectHandle page_oh);

/**
 * Interprets a page's content stream (and any form XObjects it draws) and records every glyph
 * shown: its font, effective size and bounding box. Reading the text itself is poppler's job.
 */
class PDFTextMapper {
 public:
  explicit PDFTextMapper(std::ostream& log = std::cerr);

  /** Throws whatever qpdf throws for content it cannot tokenize. */
  PageText map(QPDFPageObjectHelper& page, int page_index);

 private:
  std::ostream& m_log;
};

}  // namespace pdf_compliance
