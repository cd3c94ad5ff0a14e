#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <string>
#include <vector>

namespace pdf_compliance {

/**
 * What the glyph interpreter needs to know about one font resource: its name, how many bytes
 * make up a character code, and where each glyph sits.
 *
 * Widths and descent are in text space units per unit of font size (glyph units / 1000 for
 * everything but Type3).
 */
class PdfFont {
 public:
  static PdfFont fromQPDF(QPDFObjectHandle font_dict);

  /** /BaseFont without the leading slash, subset prefix kept. */
  const std::string& name() const { return m_name; }
  int code_length() const { return m_code_length; }
  double descent() const { return m_descent; }

  double width(unsigned code) const;
  std::vector<unsigned> codes(const std::string& raw) const;
  bool is_word_space(unsigned code) const { return m_code_length == 1 && code == 32; }

 private:
  void load_simple_widths(QPDFObjectHandle font_dict);
  void load_cid_widths(QPDFObjectHandle cid_font);
  void load_descent(QPDFObjectHandle descriptor);

  std::string m_name;
  std::string m_subtype;
  int m_code_length = 1;
  double m_scale = 0.001;
  double m_default_width = 0.5;
  double m_descent = 0;
  std::map<unsigned, double> m_widths;
};

}  // namespace pdf_compliance
