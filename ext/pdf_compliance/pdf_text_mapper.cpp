#include "pdf_text_mapper.hpp"
#include "pdf_font.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <set>
#include <stack>

using namespace pdf_compliance;

static constexpr Matrix IDENTITY = {1, 0, 0, 1, 0, 0};
static constexpr size_t MAX_FORM_DEPTH = 8;

static Matrix multiply(const Matrix& m1, const Matrix& m2) {
  return {m1[0] * m2[0] + m1[1] * m2[2],         m1[0] * m2[1] + m1[1] * m2[3],
          m1[2] * m2[0] + m1[3] * m2[2],         m1[2] * m2[1] + m1[3] * m2[3],
          m1[4] * m2[0] + m1[5] * m2[2] + m2[4], m1[4] * m2[1] + m1[5] * m2[3] + m2[5]};
}

static std::pair<double, double> apply_matrix(const Matrix& m, double x, double y) {
  double x_new = m[0] * x + m[2] * y + m[4];
  double y_new = m[1] * x + m[3] * y + m[5];
  return {x_new, y_new};
}

static std::array<double, 4> compute_bbox(double x0, double y0, double x1, double y1, const Matrix& matrix) {
  std::array<std::pair<double, double>, 4> corners = {apply_matrix(matrix, x0, y0), apply_matrix(matrix, x1, y0),
                                                      apply_matrix(matrix, x1, y1), apply_matrix(matrix, x0, y1)};

  double min_x = corners[0].first;
  double max_x = corners[0].first;
  double min_y = corners[0].second;
  double max_y = corners[0].second;

  for (int i = 1; i < 4; ++i) {
    min_x = std::min(min_x, corners[i].first);
    max_x = std::max(max_x, corners[i].first);
    min_y = std::min(min_y, corners[i].second);
    max_y = std::max(max_y, corners[i].second);
  }

  return {min_x, min_y, max_x, max_y};
}

static QPDFObjectHandle inherited(QPDFObjectHandle node, char const* key) {
  while (node.isDictionary()) {
    if (auto val = node.getKey(key); !val.isNull()) return val;
    node = node.getKey("/Parent");
  }
  return QPDFObjectHandle();  // null => not found
}

std::array<double, 4> pdf_compliance::page_media_box(QPDFObjectHandle page_oh) {
  std::array<double, 4> r = {0, 0, 612, 792};  // US Letter when the box is missing or broken

  QPDFObjectHandle box = inherited(page_oh, "/MediaBox");
  if (!box.isArray() || box.getArrayNItems() != 4) return r;
  for (int i = 0; i < 4; ++i) {
    if (!box.getArrayItem(i).isNumber()) return r;
  }

  double x0 = box.getArrayItem(0).getNumericValue();
  double y0 = box.getArrayItem(1).getNumericValue();
  double x1 = box.getArrayItem(2).getNumericValue();
  double y1 = box.getArrayItem(3).getNumericValue();
  return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

struct OperatorInfo {
  const char* name;
  const char* description;
  size_t operand_count;
};

static constexpr OperatorInfo OPERATOR_CM = {"cm", "Concatenate matrix (set CTM)", 6};
static constexpr OperatorInfo OPERATOR_Q = {"q", "Save graphics state", 0};
static constexpr OperatorInfo OPERATOR_Q_UPPER = {"Q", "Restore graphics state", 0};
static constexpr OperatorInfo OPERATOR_BT = {"BT", "Begin text object", 0};
static constexpr OperatorInfo OPERATOR_TF = {"Tf", "Set font and size", 2};
static constexpr OperatorInfo OPERATOR_TC = {"Tc", "Set character spacing", 1};
static constexpr OperatorInfo OPERATOR_TW = {"Tw", "Set word spacing", 1};
static constexpr OperatorInfo OPERATOR_TZ = {"Tz", "Set horizontal scaling", 1};
static constexpr OperatorInfo OPERATOR_TL = {"TL", "Set leading", 1};
static constexpr OperatorInfo OPERATOR_TS = {"Ts", "Set text rise", 1};
static constexpr OperatorInfo OPERATOR_TD = {"Td", "Move text position", 2};
static constexpr OperatorInfo OPERATOR_TD_UPPER = {"TD", "Move text position and set leading", 2};
static constexpr OperatorInfo OPERATOR_TM = {"Tm", "Set text matrix", 6};
static constexpr OperatorInfo OPERATOR_T_STAR = {"T*", "Move to start of next line", 0};
static constexpr OperatorInfo OPERATOR_TJ = {"Tj", "Show string", 1};
static constexpr OperatorInfo OPERATOR_TJ_UPPER = {"TJ", "Show strings with positioning", 1};
static constexpr OperatorInfo OPERATOR_QUOTE = {"'", "Next line and show string", 1};
static constexpr OperatorInfo OPERATOR_DQUOTE = {"\"", "Set spacing, next line and show string", 3};
static constexpr OperatorInfo OPERATOR_DO = {"Do", "Invoke named XObject", 1};

class TextExtractor : public QPDFObjectHandle::ParserCallbacks {
 public:
  TextExtractor(PageText& out, QPDFObjectHandle resources, const std::array<double, 4>& media_box,
                std::ostream& log)
      : out(out), media_box(media_box), log(log) {
    resources_stack.push_back(resources);
  }

  void handleEOF() override {}

  void handleObject(QPDFObjectHandle obj, size_t offset, size_t length) override {
    if (!obj.isOperator()) {
      operand_stack.push_back(obj);
      return;
    }

    std::string op = obj.getOperatorValue();
    std::vector<double> n;

    if (op == OPERATOR_Q.name) {
      gs_stack.push(gs);
    } else if (op == OPERATOR_Q_UPPER.name) {
      if (!gs_stack.empty()) {
        gs = gs_stack.top();
        gs_stack.pop();
      }
    } else if (op == OPERATOR_CM.name && numbers(OPERATOR_CM.operand_count, n)) {
      gs.ctm = multiply({n[0], n[1], n[2], n[3], n[4], n[5]}, gs.ctm);
    } else if (op == OPERATOR_BT.name) {
      tm = IDENTITY;
      tlm = IDENTITY;
    } else if (op == OPERATOR_TF.name && operand_stack.size() >= OPERATOR_TF.operand_count) {
      auto& name = operand_stack[operand_stack.size() - 2];
      auto& size = operand_stack.back();
      if (name.isName() && size.isNumber()) {
        gs.text.font = lookup_font(name.getName());
        gs.text.size = size.getNumericValue();
      }
    } else if (op == OPERATOR_TC.name && numbers(OPERATOR_TC.operand_count, n)) {
      gs.text.char_spacing = n[0];
    } else if (op == OPERATOR_TW.name && numbers(OPERATOR_TW.operand_count, n)) {
      gs.text.word_spacing = n[0];
    } else if (op == OPERATOR_TZ.name && numbers(OPERATOR_TZ.operand_count, n)) {
      gs.text.horizontal_scale = n[0] / 100.0;
    } else if (op == OPERATOR_TL.name && numbers(OPERATOR_TL.operand_count, n)) {
      gs.text.leading = n[0];
    } else if (op == OPERATOR_TS.name && numbers(OPERATOR_TS.operand_count, n)) {
      gs.text.rise = n[0];
    } else if (op == OPERATOR_TD.name && numbers(OPERATOR_TD.operand_count, n)) {
      move_text(n[0], n[1]);
    } else if (op == OPERATOR_TD_UPPER.name && numbers(OPERATOR_TD_UPPER.operand_count, n)) {
      gs.text.leading = -n[1];
      move_text(n[0], n[1]);
    } else if (op == OPERATOR_TM.name && numbers(OPERATOR_TM.operand_count, n)) {
      tm = {n[0], n[1], n[2], n[3], n[4], n[5]};
      tlm = tm;
    } else if (op == OPERATOR_T_STAR.name) {
      move_text(0, -gs.text.leading);
    } else if (op == OPERATOR_TJ.name && !operand_stack.empty()) {
      show(operand_stack.back());
    } else if (op == OPERATOR_QUOTE.name && !operand_stack.empty()) {
      move_text(0, -gs.text.leading);
      show(operand_stack.back());
    } else if (op == OPERATOR_DQUOTE.name && operand_stack.size() >= OPERATOR_DQUOTE.operand_count) {
      auto& aw = operand_stack[operand_stack.size() - 3];
      auto& ac = operand_stack[operand_stack.size() - 2];
      if (aw.isNumber() && ac.isNumber()) {
        gs.text.word_spacing = aw.getNumericValue();
        gs.text.char_spacing = ac.getNumericValue();
      }
      move_text(0, -gs.text.leading);
      show(operand_stack.back());
    } else if (op == OPERATOR_TJ_UPPER.name && !operand_stack.empty()) {
      show(operand_stack.back());
    } else if (op == OPERATOR_DO.name && !operand_stack.empty() && operand_stack.back().isName()) {
      draw_xobject(operand_stack.back().getName());
    }

    operand_stack.clear();
  }

 private:
  struct TextState {
    std::shared_ptr<const PdfFont> font;
    double size = 0;
    double char_spacing = 0;
    double word_spacing = 0;
    double horizontal_scale = 1;
    double leading = 0;
    double rise = 0;
  };

  struct GraphicsState {
    Matrix ctm = IDENTITY;
    TextState text;
  };

  bool numbers(size_t count, std::vector<double>& values) const {
    if (operand_stack.size() < count) return false;
    values.clear();
    for (size_t i = operand_stack.size() - count; i < operand_stack.size(); ++i) {
      if (!operand_stack[i].isNumber()) return false;
      values.push_back(operand_stack[i].getNumericValue());
    }
    return true;
  }

  void move_text(double tx, double ty) {
    tlm = multiply({1, 0, 0, 1, tx, ty}, tlm);
    tm = tlm;
  }

  std::shared_ptr<const PdfFont> lookup_font(const std::string& name) {
    QPDFObjectHandle resources = resources_stack.back();
    QPDFObjectHandle fonts = resources.isDictionary() ? resources.getKey("/Font") : QPDFObjectHandle();
    if (!fonts.isDictionary() || !fonts.hasKey(name)) {
      log << "pdf_compliance: text: page " << out.page_index + 1 << ": font " << name << " not in resources"
          << std::endl;
      return nullptr;
    }

    QPDFObjectHandle font_dict = fonts.getKey(name);
    try {
      if (!font_dict.isIndirect()) {
        return std::make_shared<const PdfFont>(PdfFont::fromQPDF(font_dict));
      }

      auto& cached = font_cache[font_dict.getObjGen()];
      if (!cached) cached = std::make_shared<const PdfFont>(PdfFont::fromQPDF(font_dict));
      return cached;
    } catch (const std::exception& e) {
      log << "pdf_compliance: text: page " << out.page_index + 1 << ": font " << name << " unusable: " << e.what()
          << std::endl;
      return nullptr;
    }
  }

  Matrix rendering_matrix() const {
    const TextState& ts = gs.text;
    Matrix params = {ts.size * ts.horizontal_scale, 0, 0, ts.size, 0, ts.rise};
    return multiply(params, multiply(tm, gs.ctm));
  }

  double effective_size() const {
    Matrix m = multiply(tm, gs.ctm);
    return gs.text.size * std::hypot(m[2], m[3]);
  }

  void show_codes(const std::string& raw) {
    const PdfFont& font = *gs.text.font;
    const TextState& ts = gs.text;

    for (unsigned code : font.codes(raw)) {
      double w0 = font.width(code);
      Matrix trm = rendering_matrix();

      auto bbox = compute_bbox(0, font.descent(), w0, font.descent() + 1, trm);
      CharBox box;
      box.x0 = bbox[0] - media_box[0];
      box.x1 = bbox[2] - media_box[0];
      box.top = media_box[3] - bbox[3];
      box.bottom = media_box[3] - bbox[1];
      out.chars.push_back(box);

      double tx = (w0 * ts.size + ts.char_spacing + (font.is_word_space(code) ? ts.word_spacing : 0)) *
                  ts.horizontal_scale;
      tm = multiply({1, 0, 0, 1, tx, 0}, tm);
    }
  }

  void show(QPDFObjectHandle operand) {
    if (!gs.text.font) return;
    if (!operand.isString() && !operand.isArray()) return;

    TextRun run;
    run.font_family = gs.text.font->name();
    run.font_size = effective_size();
    run.page_index = out.page_index;

    size_t glyphs_before = out.chars.size();
    if (operand.isString()) {
      show_codes(operand.getStringValue());
    } else {
      for (int i = 0; i < operand.getArrayNItems(); ++i) {
        QPDFObjectHandle item = operand.getArrayItem(i);
        if (item.isString()) {
          show_codes(item.getStringValue());
        } else if (item.isNumber()) {
          double tx = -item.getNumericValue() / 1000.0 * gs.text.size * gs.text.horizontal_scale;
          tm = multiply({1, 0, 0, 1, tx, 0}, tm);
        }
      }
    }

    run.glyph_count = out.chars.size() - glyphs_before;
    if (run.glyph_count > 0) out.runs.push_back(std::move(run));
  }

  void draw_xobject(const std::string& name) {
    QPDFObjectHandle resources = resources_stack.back();
    QPDFObjectHandle xobjects = resources.isDictionary() ? resources.getKey("/XObject") : QPDFObjectHandle();
    if (!xobjects.isDictionary() || !xobjects.hasKey(name)) return;

    QPDFObjectHandle xobject = xobjects.getKey(name);
    if (!xobject.isStream()) return;

    QPDFObjectHandle dict = xobject.getDict();
    bool is_form =
        (dict.hasKey("/Subtype") && dict.getKey("/Subtype").isName() && dict.getKey("/Subtype").getName() == "/Form");
    if (!is_form) return;

    if (resources_stack.size() > MAX_FORM_DEPTH || active_forms.count(xobject.getObjGen())) {
      log << "pdf_compliance: text: page " << out.page_index + 1 << ": skipping form " << name
          << " (nested too deep or recursive)" << std::endl;
      return;
    }

    GraphicsState saved_gs = gs;
    Matrix saved_tm = tm;
    Matrix saved_tlm = tlm;
    std::vector<QPDFObjectHandle> saved_operands;
    saved_operands.swap(operand_stack);

    QPDFObjectHandle form_matrix = dict.getKey("/Matrix");
    if (form_matrix.isArray() && form_matrix.getArrayNItems() == 6) {
      Matrix m;
      bool ok = true;
      for (int i = 0; i < 6; ++i) {
        ok = ok && form_matrix.getArrayItem(i).isNumber();
        m[i] = ok ? form_matrix.getArrayItem(i).getNumericValue() : 0;
      }
      if (ok) gs.ctm = multiply(m, gs.ctm);
    }

    QPDFObjectHandle form_resources = dict.getKey("/Resources");
    resources_stack.push_back(form_resources.isDictionary() ? form_resources : resources);
    active_forms.insert(xobject.getObjGen());

    try {
      QPDFObjectHandle::parseContentStream(xobject, this);
    } catch (const std::exception& e) {
      log << "pdf_compliance: text: page " << out.page_index + 1 << ": form " << name << " unreadable: " << e.what()
          << std::endl;
    }

    active_forms.erase(xobject.getObjGen());
    resources_stack.pop_back();
    operand_stack.swap(saved_operands);
    gs = saved_gs;
    tm = saved_tm;
    tlm = saved_tlm;
  }

  PageText& out;
  std::array<double, 4> media_box;
  std::ostream& log;

  GraphicsState gs;
  std::stack<GraphicsState> gs_stack;
  Matrix tm = IDENTITY;
  Matrix tlm = IDENTITY;
  std::vector<QPDFObjectHandle> operand_stack;
  std::vector<QPDFObjectHandle> resources_stack;
  std::set<QPDFObjGen> active_forms;
  std::map<QPDFObjGen, std::shared_ptr<const PdfFont>> font_cache;
};

PDFTextMapper::PDFTextMapper(std::ostream& log) : m_log(log) {}

PageText PDFTextMapper::map(QPDFPageObjectHelper& page, int page_index) {
  PageText result;
  result.page_index = page_index;

  auto mb = page_media_box(page.getObjectHandle());
  result.geometry.width = mb[2] - mb[0];
  result.geometry.height = mb[3] - mb[1];

  TextExtractor cb(result, inherited(page.getObjectHandle(), "/Resources"), mb, m_log);
  page.parseContents(&cb);

  return result;
}
