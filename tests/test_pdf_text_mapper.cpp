#include <catch2/catch_all.hpp>

#include "document_handle.hpp"
#include "pdf_fixture.hpp"
#include "pdf_font.hpp"
#include "pdf_text_mapper.hpp"

#include <sstream>

using namespace pdf_compliance;
using Catch::Approx;

static PageText map_first_page(const ByteBuffer& bytes, std::ostream& log) {
  auto doc = DocumentHandle::open_memory("test", bytes);
  auto pages = doc->pages();
  PDFTextMapper mapper(log);
  return mapper.map(pages.front(), 0);
}

TEST_CASE("simple Tj produces one run with font, size and glyph boxes", "[text]") {
  std::ostringstream log;
  PageText page = map_first_page(fixture::single_page(fixture::text_at("F1", 12, 100, 700, "Hi")), log);
  INFO(page.to_string());

  REQUIRE(page.runs.size() == 1);
  REQUIRE(page.runs[0].font_family == "Times-Roman");
  REQUIRE(page.runs[0].font_size == Approx(12));
  REQUIRE(page.runs[0].glyph_count == 2);

  REQUIRE(page.chars.size() == 2);
  REQUIRE(page.chars[0].x0 == Approx(100));
  REQUIRE(page.chars[0].x1 == Approx(106));
  REQUIRE(page.chars[1].x0 == Approx(106));
  REQUIRE(page.chars[1].x1 == Approx(112));
  // baseline 700, no descent, 12pt tall, measured from the top of a 792pt page
  REQUIRE(page.chars[0].top == Approx(792 - 712));
  REQUIRE(page.chars[0].bottom == Approx(792 - 700));

  REQUIRE(page.geometry.width == Approx(612));
  REQUIRE(page.geometry.height == Approx(792));
}

TEST_CASE("cm and Tm scale the effective font size", "[text]") {
  std::ostringstream log;

  SECTION("cm doubles the size") {
    PageText page = map_first_page(fixture::single_page("q 2 0 0 2 0 0 cm BT /F1 6 Tf 10 10 Td (a) Tj ET Q\n"), log);
    REQUIRE(page.runs.size() == 1);
    REQUIRE(page.runs[0].font_size == Approx(12));
    REQUIRE(page.chars[0].x0 == Approx(20));
  }

  SECTION("Tm with a vertical scale") {
    PageText page = map_first_page(fixture::single_page("BT /F2 1 Tf 11.5 0 0 11.5 72 700 Tm (a) Tj ET\n"), log);
    REQUIRE(page.runs.size() == 1);
    REQUIRE(page.runs[0].font_family == "Helvetica");
    REQUIRE(page.runs[0].font_size == Approx(11.5));
  }

  SECTION("Q restores the outer transform") {
    PageText page = map_first_page(
        fixture::single_page("q 3 0 0 3 0 0 cm Q BT /F1 12 Tf 72 700 Td (a) Tj ET\n"), log);
    REQUIRE(page.runs[0].font_size == Approx(12));
  }
}

TEST_CASE("TJ adjustments and T* move the following glyphs", "[text]") {
  std::ostringstream log;
  PageText page = map_first_page(
      fixture::single_page("BT /F1 12 Tf 14 TL 72 700 Td [(ab) -500 (c)] TJ T* (d) Tj ET\n"), log);

  REQUIRE(page.runs.size() == 2);
  REQUIRE(page.runs[0].glyph_count == 3);
  REQUIRE(page.chars.size() == 4);
  // two 6pt glyphs, then a 500/1000 em gap at 12pt
  REQUIRE(page.chars[2].x0 == Approx(72 + 12 + 6));
  // next line starts back at x = 72, 14pt lower
  REQUIRE(page.chars[3].x0 == Approx(72));
  REQUIRE(page.chars[3].bottom == Approx(792 - 686));
}

TEST_CASE("text drawn through a form XObject is found", "[text]") {
  std::ostringstream log;
  fixture::PdfBuilder builder;
  builder.set_form_content(fixture::text_at("F2", 10, 50, 50, "Inside"));
  builder.add_page("q 1 0 0 1 100 100 cm /Fm1 Do Q\n");
  PageText page = map_first_page(builder.build(), log);

  REQUIRE(page.runs.size() == 1);
  REQUIRE(page.runs[0].font_family == "Helvetica");
  REQUIRE(page.runs[0].glyph_count == 6);
  REQUIRE(page.chars[0].x0 == Approx(150));
}

TEST_CASE("Type0 font reads two-byte codes with CID widths", "[text][font]") {
  std::ostringstream log;
  PageText page = map_first_page(fixture::single_page("BT /F3 10 Tf 72 700 Td <0001000200030004> Tj ET\n"), log);

  REQUIRE(page.runs.size() == 1);
  REQUIRE(page.runs[0].font_family == "ABCDEF+TimesNewRomanPSMT");
  REQUIRE(page.chars.size() == 4);
  // CID 1 is 600 units wide, descent -200 drops the box below the baseline
  REQUIRE(page.chars[0].x1 - page.chars[0].x0 == Approx(6));
  REQUIRE(page.chars[1].x1 - page.chars[1].x0 == Approx(5));
  REQUIRE(page.chars[0].bottom == Approx(792 - 698));
}

TEST_CASE("PdfFont reads widths, code length and descent", "[font]") {
  fixture::PdfBuilder builder;
  PdfFont font = PdfFont::fromQPDF(builder.type0_font());

  REQUIRE(font.name() == "ABCDEF+TimesNewRomanPSMT");
  REQUIRE(font.code_length() == 2);
  REQUIRE(font.width(1) == Approx(0.6));
  REQUIRE(font.width(7) == Approx(0.5));
  REQUIRE(font.descent() == Approx(-0.2));
  REQUIRE(font.codes(std::string("\x00\x01\x00\x02", 4)) == std::vector<unsigned>{1, 2});
  REQUIRE_FALSE(font.is_word_space(32));
}

TEST_CASE("missing font resources and empty pages produce no runs", "[text]") {
  std::ostringstream log;

  PageText unknown = map_first_page(fixture::single_page("BT /F9 12 Tf 72 700 Td (lost) Tj ET\n"), log);
  REQUIRE(unknown.runs.empty());
  REQUIRE(unknown.chars.empty());
  REQUIRE(log.str().find("/F9") != std::string::npos);

  PageText blank = map_first_page(fixture::single_page("0 0 m 100 100 l S\n"), log);
  REQUIRE(blank.runs.empty());
  REQUIRE(blank.chars.empty());
}

TEST_CASE("out-of-range codes in font dictionaries are ignored", "[font]") {
  SECTION("simple font with an absurd /FirstChar") {
    PdfFont font = PdfFont::fromQPDF(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Times-Roman "
        "/FirstChar 100000000000000000000.0 /Widths [ 700 700 ] >>"));
    REQUIRE(font.width(0) == Approx(0));
    REQUIRE(font.width(1) == Approx(0));
  }

  SECTION("simple font whose widths run past code 255") {
    PdfFont font = PdfFont::fromQPDF(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Times-Roman /FirstChar 255 /Widths [ 700 700 700 ] >>"));
    REQUIRE(font.width(255) == Approx(0.7));
    REQUIRE(font.width(256) == Approx(0));
  }

  SECTION("CID widths with negative and oversized CIDs") {
    PdfFont font = PdfFont::fromQPDF(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type0 /BaseFont /X /Encoding /Identity-H /DescendantFonts [ "
        "<< /Type /Font /Subtype /CIDFontType2 /BaseFont /X /DW 400 "
        "/W [ -1 [ 900 ] 3 1000000000000.0 900 5 5 800 7 [ 600 ] ] >> ] >>"));
    REQUIRE(font.width(0) == Approx(0.4));
    REQUIRE(font.width(3) == Approx(0.4));
    REQUIRE(font.width(5) == Approx(0.8));
    REQUIRE(font.width(7) == Approx(0.6));
  }
}

TEST_CASE("page geometry follows the MediaBox", "[text]") {
  std::ostringstream log;
  fixture::PdfBuilder builder;
  builder.add_page(fixture::text_at("F1", 12, 10, 10, "a"), 595, 842);
  PageText page = map_first_page(builder.build(), log);

  REQUIRE(page.geometry.width == Approx(595));
  REQUIRE(page.geometry.height == Approx(842));
  REQUIRE(page.chars[0].bottom == Approx(832));
}
