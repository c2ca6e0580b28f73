// flow_diag.cpp - Diagnostics sink

#include "flow_diag.hpp"
#include "lib/log.h"
#include <cstring>

namespace quire {

void Diagnostics::init(Arena* a) {
    arena = a;
    items = nullptr;
    count = 0;
    capacity = 0;
}

void Diagnostics::push(Severity severity, SourceLoc loc, const char* msg, const char* hint) {
    if (count >= capacity) {
        int new_capacity = capacity ? capacity * 2 : 16;
        Diagnostic* grown = (Diagnostic*)arena_alloc(arena, new_capacity * sizeof(Diagnostic));
        if (!grown) {
            log_error("flow: out of memory recording diagnostic: %s", msg);
            return;
        }
        if (items) {
            memcpy(grown, items, count * sizeof(Diagnostic));
        }
        items = grown;
        capacity = new_capacity;
    }

    items[count].severity = severity;
    items[count].loc = loc;
    items[count].message = msg;
    items[count].hint = hint;
    count++;
}

void Diagnostics::add_error(SourceLoc loc, const char* msg, const char* hint) {
    push(Severity::Error, loc, msg, hint);
    log_error("flow: %s at line %d:%d", msg, loc.line, loc.column);
    if (hint) log_info("flow: hint: %s", hint);
}

void Diagnostics::add_warning(SourceLoc loc, const char* msg, const char* hint) {
    for (int i = 0; i < count; i++) {
        const Diagnostic& d = items[i];
        if (d.severity == Severity::Warning && d.loc.start == loc.start &&
            d.loc.end == loc.end && strcmp(d.message, msg) == 0) {
            return;
        }
    }
    push(Severity::Warning, loc, msg, hint);
    log_warn("flow: %s at line %d:%d", msg, loc.line, loc.column);
}

void Diagnostics::replay(const Diagnostic& d) {
    if (d.severity == Severity::Warning) {
        add_warning(d.loc, d.message, d.hint);
    } else {
        add_error(d.loc, d.message, d.hint);
    }
}

int Diagnostics::error_count() const {
    int n = 0;
    for (int i = 0; i < count; i++) {
        if (items[i].severity == Severity::Error) n++;
    }
    return n;
}

int Diagnostics::warning_count() const {
    return count - error_count();
}

} // namespace quire
