#ifndef PDF_COMPLIANCE_H
#define PDF_COMPLIANCE_H 1

#include "ruby.h"

VALUE rb_pdf_compliance_analyze(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_compliance_validate_formatting(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_compliance_validate_content(int argc, VALUE* argv, VALUE self);
VALUE rb_pdf_compliance_valid_pdf(VALUE self, VALUE bytes);
VALUE rb_pdf_compliance_default_policy(VALUE self);

#endif /* PDF_COMPLIANCE_H */
