#include "pdf_font.hpp"

#include <cmath>

using namespace pdf_compliance;

static constexpr unsigned MAX_SIMPLE_CODE = 0xFF;
static constexpr unsigned MAX_CID = 0xFFFF;

static double number_or(QPDFObjectHandle obj, double fallback) {
  return obj.isNumber() ? obj.getNumericValue() : fallback;
}

// character codes and CIDs come from untrusted dictionaries; reject anything outside [0, max]
static bool to_code(QPDFObjectHandle obj, unsigned max, unsigned& code) {
  if (!obj.isNumber()) return false;
  double v = obj.getNumericValue();
  if (!std::isfinite(v) || v < 0 || v > max) return false;
  code = static_cast<unsigned>(v);
  return true;
}

PdfFont PdfFont::fromQPDF(QPDFObjectHandle font_dict) {
  PdfFont font;
  if (!font_dict.isDictionary()) return font;

  QPDFObjectHandle base = font_dict.getKey("/BaseFont");
  if (base.isName()) {
    font.m_name = base.getName().substr(1);
  }

  QPDFObjectHandle subtype = font_dict.getKey("/Subtype");
  if (subtype.isName()) font.m_subtype = subtype.getName();

  if (font.m_subtype == "/Type0") {
    // Identity-H/V and the predefined CJK CMaps used in practice are all two bytes wide
    font.m_code_length = 2;
    font.m_default_width = 1.0;
    QPDFObjectHandle descendants = font_dict.getKey("/DescendantFonts");
    if (descendants.isArray() && descendants.getArrayNItems() > 0) {
      QPDFObjectHandle cid_font = descendants.getArrayItem(0);
      font.load_cid_widths(cid_font);
      font.load_descent(cid_font.getKey("/FontDescriptor"));
    }
  } else {
    if (font.m_subtype == "/Type3") {
      QPDFObjectHandle fm = font_dict.getKey("/FontMatrix");
      if (fm.isArray() && fm.getArrayNItems() == 6) font.m_scale = number_or(fm.getArrayItem(0), 0.001);
      if (font.m_name.empty()) {
        QPDFObjectHandle name = font_dict.getKey("/Name");
        if (name.isName()) font.m_name = name.getName().substr(1);
      }
    }
    font.load_simple_widths(font_dict);
    font.load_descent(font_dict.getKey("/FontDescriptor"));
  }

  return font;
}

void PdfFont::load_simple_widths(QPDFObjectHandle font_dict) {
  QPDFObjectHandle widths = font_dict.getKey("/Widths");
  if (!widths.isArray()) {
    // standard 14 fonts may omit /Widths; half an em is close enough for placement
    m_default_width = 0.5;
    return;
  }

  QPDFObjectHandle descriptor = font_dict.getKey("/FontDescriptor");
  m_default_width = descriptor.isDictionary() ? number_or(descriptor.getKey("/MissingWidth"), 0) * m_scale : 0;

  unsigned first_char = 0;
  if (font_dict.hasKey("/FirstChar") && !to_code(font_dict.getKey("/FirstChar"), MAX_SIMPLE_CODE, first_char)) {
    return;
  }

  for (int i = 0; i < widths.getArrayNItems(); ++i) {
    unsigned code = first_char + static_cast<unsigned>(i);
    if (code > MAX_SIMPLE_CODE) break;
    QPDFObjectHandle w = widths.getArrayItem(i);
    if (w.isNumber()) m_widths[code] = w.getNumericValue() * m_scale;
  }
}

void PdfFont::load_cid_widths(QPDFObjectHandle cid_font) {
  if (!cid_font.isDictionary()) return;

  m_default_width = number_or(cid_font.getKey("/DW"), 1000) * m_scale;

  // /W [ c [w1 w2 ...]  c_first c_last w ... ]
  QPDFObjectHandle w = cid_font.getKey("/W");
  if (!w.isArray()) return;

  int n = w.getArrayNItems();
  int i = 0;
  while (i + 1 < n) {
    QPDFObjectHandle first = w.getArrayItem(i);
    QPDFObjectHandle next = w.getArrayItem(i + 1);
    if (!first.isNumber()) break;

    unsigned c = 0;
    bool valid = to_code(first, MAX_CID, c);
    if (next.isArray()) {
      for (int k = 0; valid && k < next.getArrayNItems() && c + static_cast<unsigned>(k) <= MAX_CID; ++k) {
        m_widths[c + static_cast<unsigned>(k)] = number_or(next.getArrayItem(k), 0) * m_scale;
      }
      i += 2;
    } else if (i + 2 < n && next.isNumber()) {
      unsigned last = 0;
      if (valid && to_code(next, MAX_CID, last)) {
        double width = number_or(w.getArrayItem(i + 2), 0) * m_scale;
        for (unsigned cid = c; cid <= last; ++cid) m_widths[cid] = width;
      }
      i += 3;
    } else {
      break;
    }
  }
}

void PdfFont::load_descent(QPDFObjectHandle descriptor) {
  if (!descriptor.isDictionary()) return;
  m_descent = number_or(descriptor.getKey("/Descent"), 0) * 0.001;
}

double PdfFont::width(unsigned code) const {
  auto it = m_widths.find(code);
  return it != m_widths.end() ? it->second : m_default_width;
}

std::vector<unsigned> PdfFont::codes(const std::string& raw) const {
  std::vector<unsigned> result;
  result.reserve(raw.size() / static_cast<size_t>(m_code_length) + 1);
  for (size_t i = 0; i < raw.size(); i += static_cast<size_t>(m_code_length)) {
    unsigned code = 0;
    for (int k = 0; k < m_code_length; ++k) {
      unsigned char byte = i + static_cast<size_t>(k) < raw.size() ? static_cast<unsigned char>(raw[i + k]) : 0;
      code = (code << 8) | byte;
    }
    result.push_back(code);
  }
  return result;
}
