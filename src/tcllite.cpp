#include <R.h>
#include <Rinternals.h>
#include <R_ext/Rdynload.h>
#ifdef error
#undef error
#endif
#ifdef length
#undef length
#endif

#include <cstdio>
#include <string>
#include <vector>

#include "tcl_encoder.hpp"
#include "tcl_errors.hpp"
#include "tcl_quote.hpp"
#include "tcl_value.hpp"

using namespace tcllite;

// Conversion state shared across one R object
struct ConvertContext {
    bool strict = false;
    int max_depth = kDefaultMaxDepth;
    std::vector<size_t> path;
    std::vector<Warning> warnings;
};

static std::string path_string(const std::vector<size_t>& path) {
    std::string s;
    for (size_t index : path) {
        s += "[" + std::to_string(index + 1) + "]";
    }
    return s;
}

static Value na_value(ConvertContext& ctx) {
    if (ctx.strict) {
        throw EncodeError("NA values not allowed in strict mode",
                          ErrorType::ENCODING_ERROR,
                          static_cast<int>(ctx.path.size()), ctx.path);
    }
    ctx.warnings.emplace_back("na", "NA value at element " + path_string(ctx.path) +
                                        " written as an empty element");
    return Value::make_text("");
}

static Value sexp_to_list(SEXP x, ConvertContext& ctx, int depth);

// Element i of an atomic vector or list
static Value sexp_element(SEXP x, R_xlen_t i, ConvertContext& ctx, int depth) {
    switch (TYPEOF(x)) {
        case LGLSXP: {
            int val = LOGICAL(x)[i];
            if (val == NA_LOGICAL) {
                return na_value(ctx);
            }
            return Value::make_bool(val != 0);
        }
        case INTSXP: {
            int val = INTEGER(x)[i];
            if (val == NA_INTEGER) {
                return na_value(ctx);
            }
            // Factors encode their labels
            SEXP levels = Rf_getAttrib(x, R_LevelsSymbol);
            if (levels != R_NilValue) {
                size_t index = factor_level_index(val, static_cast<size_t>(Rf_xlength(levels)),
                                                  depth, ctx.path);
                return Value::make_text(Rf_translateCharUTF8(
                    STRING_ELT(levels, static_cast<R_xlen_t>(index))));
            }
            return Value::make_int(val);
        }
        case REALSXP: {
            double val = REAL(x)[i];
            if (ISNA(val)) {
                return na_value(ctx);
            }
            return Value::make_double(val);
        }
        case STRSXP: {
            SEXP elem = STRING_ELT(x, i);
            if (elem == NA_STRING) {
                return na_value(ctx);
            }
            return Value::make_text(Rf_translateCharUTF8(elem));
        }
        case VECSXP: {
            SEXP item = VECTOR_ELT(x, i);
            bool is_scalar = item != R_NilValue && TYPEOF(item) != VECSXP &&
                             Rf_xlength(item) == 1;
            if (is_scalar) {
                return sexp_element(item, 0, ctx, depth);
            }
            return sexp_to_list(item, ctx, depth + 1);
        }
        default:
            throw EncodeError(std::string("Unsupported R type: ") + Rf_type2char(TYPEOF(x)),
                              ErrorType::TYPE_ERROR, depth, ctx.path);
    }
}

static Value sexp_to_list(SEXP x, ConvertContext& ctx, int depth) {
    if (depth > ctx.max_depth) {
        throw EncodeError("nesting too deep (limit " + std::to_string(ctx.max_depth) +
                              " levels)",
                          ErrorType::DEPTH_ERROR, depth, ctx.path);
    }

    Value list = Value::make_list();
    if (x == R_NilValue) {
        return list;
    }

    R_xlen_t n = Rf_xlength(x);
    list.list_items.reserve(static_cast<size_t>(n));
    for (R_xlen_t i = 0; i < n; i++) {
        ctx.path.push_back(static_cast<size_t>(i));
        list.push_back(sexp_element(x, i, ctx, depth));
        ctx.path.pop_back();
    }
    return list;
}

// Helper to emit warnings collected during conversion and encoding
static void emit_warnings(const std::vector<Warning>& warnings) {
    for (const auto& w : warnings) {
        Rf_warning("%s", w.message.c_str());
    }
}

static SEXP mk_utf8_string(const std::string& s) {
    return Rf_mkCharLenCE(s.data(), static_cast<int>(s.size()), CE_UTF8);
}

extern "C" {

// Encode an R vector or list as a Tcl list
SEXP C_tcl_list(SEXP x, SEXP strict, SEXP max_depth) {
    char err_buf[1024];
    err_buf[0] = '\0';

    try {
        EncodeOptions opts;
        opts.strict = Rf_asLogical(strict) == TRUE;
        int depth_arg = Rf_asInteger(max_depth);
        if (depth_arg != NA_INTEGER && depth_arg > 0) {
            opts.max_depth = depth_arg;
        }

        ConvertContext ctx;
        ctx.strict = opts.strict;
        ctx.max_depth = opts.max_depth;
        Value top = sexp_to_list(x, ctx, 1);

        Encoder encoder(opts);
        std::string result = encoder.encode(top.list_items);
        emit_warnings(ctx.warnings);
        emit_warnings(encoder.warnings());

        SEXP out = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(out, 0, mk_utf8_string(result));

        // Set class
        SEXP class_attr = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(class_attr, 0, Rf_mkChar("tcl_list"));
        Rf_setAttrib(out, R_ClassSymbol, class_attr);

        UNPROTECT(2);
        return out;
    } catch (const EncodeError& e) {
        std::snprintf(err_buf, sizeof(err_buf), "%s", e.formatted_message().c_str());
    } catch (const std::exception& e) {
        std::snprintf(err_buf, sizeof(err_buf), "Error encoding Tcl list: %s", e.what());
    }

    // Rf_error longjmps; raise it after the exception objects are gone
    Rf_error("%s", err_buf);
    return R_NilValue;
}

// Quote each string of a character vector as a list element
SEXP C_tcl_quote(SEXP s) {
    if (TYPEOF(s) != STRSXP) {
        Rf_error("Expected a character vector");
    }

    char err_buf[1024];
    err_buf[0] = '\0';

    R_xlen_t n = Rf_xlength(s);
    SEXP out = PROTECT(Rf_allocVector(STRSXP, n));
    try {
        for (R_xlen_t i = 0; i < n; i++) {
            SEXP elem = STRING_ELT(s, i);
            if (elem == NA_STRING) {
                SET_STRING_ELT(out, i, NA_STRING);
            } else {
                SET_STRING_ELT(out, i, mk_utf8_string(quote_element(Rf_translateCharUTF8(elem))));
            }
        }
        UNPROTECT(1);
        return out;
    } catch (const std::exception& e) {
        std::snprintf(err_buf, sizeof(err_buf), "Error quoting Tcl list elements: %s", e.what());
    }

    UNPROTECT(1);
    Rf_error("%s", err_buf);
    return R_NilValue;
}

// Report the quoting style each string needs
SEXP C_tcl_quote_style(SEXP s) {
    if (TYPEOF(s) != STRSXP) {
        Rf_error("Expected a character vector");
    }

    char err_buf[1024];
    err_buf[0] = '\0';

    R_xlen_t n = Rf_xlength(s);
    SEXP out = PROTECT(Rf_allocVector(STRSXP, n));
    try {
        for (R_xlen_t i = 0; i < n; i++) {
            SEXP elem = STRING_ELT(s, i);
            if (elem == NA_STRING) {
                SET_STRING_ELT(out, i, NA_STRING);
            } else {
                QuoteStyle style = classify_element(Rf_translateCharUTF8(elem));
                SET_STRING_ELT(out, i, Rf_mkChar(quote_style_name(style)));
            }
        }
        UNPROTECT(1);
        return out;
    } catch (const std::exception& e) {
        std::snprintf(err_buf, sizeof(err_buf), "Error classifying Tcl list elements: %s", e.what());
    }

    UNPROTECT(1);
    Rf_error("%s", err_buf);
    return R_NilValue;
}

static const R_CallMethodDef CallEntries[] = {
    {"C_tcl_list", (DL_FUNC) &C_tcl_list, 3},
    {"C_tcl_quote", (DL_FUNC) &C_tcl_quote, 1},
    {"C_tcl_quote_style", (DL_FUNC) &C_tcl_quote_style, 1},
    {NULL, NULL, 0}
};

void R_init_tcllite(DllInfo* dll) {
    R_registerRoutines(dll, NULL, CallEntries, NULL, NULL);
    R_useDynamicSymbols(dll, FALSE);
}

} // extern "C"
