#include "pdf_compliance.hpp"
#include "native_call.hpp"

#include <cstring>

VALUE rb_mPdfCompliance;
VALUE rb_ePdfComplianceError;

using namespace pdf_compliance;

// rb_raise longjmps, so nothing with a destructor may be alive when Ruby can raise: arguments are
// read into PolicyArgs first and run_native() hands results back as plain values.

static bool category_matches(VALUE name, SectionCategory c) {
  const char* expected = section_category_name(c);
  size_t len = std::strlen(expected);
  return static_cast<size_t>(RSTRING_LEN(name)) == len && std::memcmp(RSTRING_PTR(name), expected, len) == 0;
}

static void read_section_limits(VALUE limits, PolicyArgs& args) {
  Check_Type(limits, T_HASH);
  VALUE pairs = rb_funcall(limits, rb_intern("to_a"), 0);

  for (long i = 0; i < RARRAY_LEN(pairs); ++i) {
    VALUE pair = rb_ary_entry(pairs, i);
    VALUE key = rb_ary_entry(pair, 0);
    if (SYMBOL_P(key)) key = rb_sym2str(key);
    Check_Type(key, T_STRING);

    size_t found = SECTION_CATEGORY_COUNT;
    for (size_t c = 0; c < SECTION_CATEGORY_COUNT; ++c) {
      if (category_matches(key, static_cast<SectionCategory>(c))) found = c;
    }
    if (found == SECTION_CATEGORY_COUNT) {
      rb_raise(rb_ePdfComplianceError, "unknown section category: %" PRIsVALUE, key);
    }
    args.has_limit[found] = true;
    args.limit[found] = NUM2INT(rb_ary_entry(pair, 1));
  }
}

static PolicyArgs read_policy_args(VALUE kwargs) {
  PolicyArgs args;

  ID keys[6];
  VALUE values[6];

  keys[0] = rb_intern("required_font_size");
  keys[1] = rb_intern("required_font_family");
  keys[2] = rb_intern("required_margin_inches");
  keys[3] = rb_intern("margin_tolerance_inches");
  keys[4] = rb_intern("font_size_tolerance");
  keys[5] = rb_intern("section_page_limits");

  // unknown keywords raise ArgumentError, missing ones come back as Qundef
  rb_get_kwargs(kwargs, keys, 0, 6, values);

  if (values[0] != Qundef) {
    args.has_font_size = true;
    args.font_size = NUM2INT(values[0]);
  }
  // a String, not something converted with to_str, so the kwargs hash keeps it alive for the call
  if (values[1] != Qundef) {
    Check_Type(values[1], T_STRING);
    args.font_family = StringValueCStr(values[1]);
  }
  if (values[2] != Qundef) {
    args.has_margin = true;
    args.margin = NUM2DBL(values[2]);
  }
  if (values[3] != Qundef) {
    args.has_margin_tolerance = true;
    args.margin_tolerance = NUM2DBL(values[3]);
  }
  if (values[4] != Qundef) {
    args.has_font_size_tolerance = true;
    args.font_size_tolerance = NUM2INT(values[4]);
  }
  if (values[5] != Qundef) read_section_limits(values[5], args);

  return args;
}

static NativeOutcome run_or_raise(NativeOperation op, VALUE bytes, const PolicyArgs& args) {
  Check_Type(bytes, T_STRING);

  NativeOutcome out;
  auto* data = reinterpret_cast<const unsigned char*>(RSTRING_PTR(bytes));
  if (!run_native(op, data, static_cast<size_t>(RSTRING_LEN(bytes)), args, out)) {
    rb_raise(rb_ePdfComplianceError, "%s", out.error);
  }
  return out;
}

static VALUE format_to_hash(const NativeOutcome& out) {
  VALUE h = rb_hash_new();
  for (const auto& field : out.format) {
    rb_hash_aset(h, rb_str_new_cstr(field.first), rb_str_new_cstr(to_string(field.second)));
  }
  return h;
}

static VALUE content_to_hash(const NativeOutcome& out) {
  VALUE h = rb_hash_new();
  for (size_t c = 0; c < SECTION_CATEGORY_COUNT; ++c) {
    if (!out.has_section[c]) continue;

    const char* name = section_category_name(static_cast<SectionCategory>(c));
    rb_hash_aset(h, rb_str_cat_cstr(rb_str_new_cstr(name), "_pages"), INT2NUM(out.sections[c].page_count));
    rb_hash_aset(h, rb_str_new_cstr(name), rb_str_new_cstr(to_string(out.sections[c].status)));
  }
  return h;
}

VALUE rb_pdf_compliance_analyze(int argc, VALUE* argv, VALUE self) {
  VALUE bytes, kwargs;
  rb_scan_args(argc, argv, "1:", &bytes, &kwargs);

  NativeOutcome out = run_or_raise(NativeOperation::Analyze, bytes, read_policy_args(kwargs));

  VALUE h = rb_hash_new();
  rb_hash_aset(h, rb_str_new_cstr("format"), format_to_hash(out));
  rb_hash_aset(h, rb_str_new_cstr("content"), content_to_hash(out));
  return h;
}

VALUE rb_pdf_compliance_validate_formatting(int argc, VALUE* argv, VALUE self) {
  VALUE bytes, kwargs;
  rb_scan_args(argc, argv, "1:", &bytes, &kwargs);

  return format_to_hash(run_or_raise(NativeOperation::Format, bytes, read_policy_args(kwargs)));
}

VALUE rb_pdf_compliance_validate_content(int argc, VALUE* argv, VALUE self) {
  VALUE bytes, kwargs;
  rb_scan_args(argc, argv, "1:", &bytes, &kwargs);

  return content_to_hash(run_or_raise(NativeOperation::Content, bytes, read_policy_args(kwargs)));
}

VALUE rb_pdf_compliance_valid_pdf(VALUE self, VALUE bytes) {
  return run_or_raise(NativeOperation::Validity, bytes, PolicyArgs()).valid ? Qtrue : Qfalse;
}

VALUE rb_pdf_compliance_default_policy(VALUE self) {
  // static storage: no destructor is skipped if a Ruby allocation below raises
  static const CompliancePolicy policy = CompliancePolicy::defaults();

  VALUE limits = rb_hash_new();
  for (const auto& kv : policy.section_page_limits) {
    rb_hash_aset(limits, ID2SYM(rb_intern(section_category_name(kv.first))), INT2NUM(kv.second));
  }

  VALUE h = rb_hash_new();
  rb_hash_aset(h, ID2SYM(rb_intern("required_font_size")), INT2NUM(policy.required_font_size));
  rb_hash_aset(h, ID2SYM(rb_intern("required_font_family")), rb_str_new_cstr(policy.required_font_family.c_str()));
  rb_hash_aset(h, ID2SYM(rb_intern("required_margin_inches")), DBL2NUM(policy.required_margin_inches));
  rb_hash_aset(h, ID2SYM(rb_intern("margin_tolerance_inches")), DBL2NUM(policy.margin_tolerance_inches));
  rb_hash_aset(h, ID2SYM(rb_intern("font_size_tolerance")), INT2NUM(policy.font_size_tolerance));
  rb_hash_aset(h, ID2SYM(rb_intern("section_page_limits")), limits);
  return h;
}

RUBY_FUNC_EXPORTED "C" void Init_pdf_compliance(void) {
  rb_mPdfCompliance = rb_define_module("PdfCompliance");
  rb_ePdfComplianceError = rb_define_class_under(rb_mPdfCompliance, "Error", rb_eStandardError);

  rb_define_module_function(rb_mPdfCompliance, "analyze", RUBY_METHOD_FUNC(rb_pdf_compliance_analyze), -1);
  rb_define_module_function(rb_mPdfCompliance, "validate_formatting",
                            RUBY_METHOD_FUNC(rb_pdf_compliance_validate_formatting), -1);
  rb_define_module_function(rb_mPdfCompliance, "validate_content",
                            RUBY_METHOD_FUNC(rb_pdf_compliance_validate_content), -1);
  rb_define_module_function(rb_mPdfCompliance, "valid_pdf?", RUBY_METHOD_FUNC(rb_pdf_compliance_valid_pdf), 1);
  rb_define_module_function(rb_mPdfCompliance, "default_policy", RUBY_METHOD_FUNC(rb_pdf_compliance_default_policy),
                            0);

  VALUE categories = rb_ary_new();
  for (SectionCategory c : all_section_categories()) rb_ary_push(categories, rb_str_new_cstr(section_category_name(c)));
  rb_define_const(rb_mPdfCompliance, "SECTION_CATEGORIES", rb_obj_freeze(categories));
}
