// flow_style.cpp - Style configuration parsing

#include "flow_style.hpp"
#include "lib/log.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace quire {

// ============================================================================
// Value Parsing
// ============================================================================

static char* trim(char* s) {
    while (*s && isspace((unsigned char)*s)) s++;
    char* end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) *--end = '\0';
    return s;
}

static bool parse_length(const char* value, float em_size, float* out) {
    char* rest = nullptr;
    float v = strtof(value, &rest);
    if (rest == value) return false;
    while (*rest && isspace((unsigned char)*rest)) rest++;
    if (*rest && strcmp(rest, "pt") && strcmp(rest, "mm") && strcmp(rest, "cm") &&
        strcmp(rest, "in") && strcmp(rest, "em")) {
        return false;
    }
    *out = flow_unit_to_pt(v, rest, em_size);
    return true;
}

// Length or "auto" (stored as -1)
static bool parse_auto_length(const char* value, float em_size, float* out) {
    if (strcmp(value, "auto") == 0) {
        *out = -1;
        return true;
    }
    return parse_length(value, em_size, out) && *out >= 0;
}

static bool parse_bool(const char* value, bool* out) {
    if (!strcmp(value, "true") || !strcmp(value, "yes") || !strcmp(value, "1")) {
        *out = true;
        return true;
    }
    if (!strcmp(value, "false") || !strcmp(value, "no") || !strcmp(value, "0")) {
        *out = false;
        return true;
    }
    return false;
}

// ============================================================================
// Key Dispatch
// ============================================================================

static bool apply_style_key(FlowStyle* s, const char* key, const char* value) {
    float em = s->font_size;

    if (!strcmp(key, "dir")) {
        if (!strcmp(value, "ltr")) { s->dir = Dir::LTR; return true; }
        if (!strcmp(value, "rtl")) { s->dir = Dir::RTL; return true; }
        return false;
    }
    if (!strcmp(key, "font_size")) {
        float v;
        if (!parse_length(value, em, &v) || v <= 0) return false;
        s->font_size = v;
        return true;
    }
    if (!strcmp(key, "leading")) return parse_length(value, em, &s->leading);
    if (!strcmp(key, "par_spacing")) return parse_length(value, em, &s->par_spacing);
    if (!strcmp(key, "block_above")) return parse_auto_length(value, em, &s->block_above);
    if (!strcmp(key, "block_below")) return parse_auto_length(value, em, &s->block_below);
    if (!strcmp(key, "orphan_prevention")) return parse_bool(value, &s->orphan_prevention);
    if (!strcmp(key, "widow_prevention")) return parse_bool(value, &s->widow_prevention);
    if (!strcmp(key, "float_clearance")) return parse_length(value, em, &s->float_clearance);
    if (!strcmp(key, "footnote_clearance")) return parse_length(value, em, &s->footnote_clearance);
    if (!strcmp(key, "footnote_gap")) return parse_length(value, em, &s->footnote_gap);
    if (!strcmp(key, "line_numbering_scope")) {
        if (!strcmp(value, "document")) { s->line_numbering_scope = LineNumberingScope::Document; return true; }
        if (!strcmp(value, "page")) { s->line_numbering_scope = LineNumberingScope::Page; return true; }
        return false;
    }
    if (!strcmp(key, "line_number_clearance")) return parse_auto_length(value, em, &s->line_number_clearance);
    if (!strcmp(key, "line_number_digit_width")) return parse_length(value, em, &s->line_number_digit_width);
    if (!strcmp(key, "page_width")) {
        float v;
        if (!parse_length(value, em, &v) || v <= 0) return false;
        s->page_width = v;
        return true;
    }

    log_warn("flow_style: unknown key '%s'", key);
    return false;
}

static bool apply_style_line(FlowStyle* style, char* line, int line_no) {
    char* hash = strchr(line, '#');
    if (hash) *hash = '\0';
    char* s = trim(line);
    if (!*s) return true;

    char* eq = strchr(s, '=');
    if (!eq) {
        log_warn("flow_style: line %d: expected 'key = value'", line_no);
        return false;
    }
    *eq = '\0';
    char* key = trim(s);
    char* value = trim(eq + 1);
    if (!apply_style_key(style, key, value)) {
        log_warn("flow_style: line %d: invalid value '%s' for '%s'", line_no, value, key);
        return false;
    }
    log_debug("flow_style: %s = %s", key, value);
    return true;
}

// ============================================================================
// Public API
// ============================================================================

int flow_style_parse(FlowStyle* style, const char* text) {
    if (!style || !text) return 0;

    size_t len = strlen(text);
    char* copy = (char*)malloc(len + 1);
    if (!copy) {
        log_error("flow_style: out of memory");
        return 1;
    }
    memcpy(copy, text, len + 1);

    int rejected = 0;
    int line_no = 1;
    char* line = copy;
    while (line && *line) {
        char* next = strchr(line, '\n');
        if (next) *next++ = '\0';
        if (!apply_style_line(style, line, line_no)) rejected++;
        line = next;
        line_no++;
    }
    free(copy);
    return rejected;
}

bool flow_style_load(FlowStyle* style, const char* path) {
    FILE* f = fopen(path, "r");
    if (!f) {
        log_error("flow_style: cannot open '%s'", path);
        return false;
    }

    int rejected = 0;
    int line_no = 1;
    char line[512];
    while (fgets(line, sizeof(line), f)) {
        if (!apply_style_line(style, line, line_no)) rejected++;
        line_no++;
    }
    fclose(f);

    if (rejected > 0) {
        log_error("flow_style: %d invalid line(s) in '%s'", rejected, path);
    }
    return rejected == 0;
}

} // namespace quire
