// flow_diag.hpp - Source-located diagnostics for flow layout
//
// Warnings and errors accumulate in order. Warnings never abort layout;
// an error aborts the current flow invocation and discards its frames.

#ifndef QUIRE_FLOW_DIAG_HPP
#define QUIRE_FLOW_DIAG_HPP

#include "flow_node.hpp"
#include "lib/arena.h"

namespace quire {

enum class Severity : uint8_t {
    Warning,
    Error,
};

struct Diagnostic {
    Severity severity;
    SourceLoc loc;
    const char* message;
    const char* hint;       // Optional
};

struct Diagnostics {
    Arena* arena;
    Diagnostic* items;
    int count;
    int capacity;

    void init(Arena* a);

    // Record a fatal error
    void add_error(SourceLoc loc, const char* msg, const char* hint = nullptr);

    // Record a warning. An identical warning at the same location is only
    // recorded once.
    void add_warning(SourceLoc loc, const char* msg, const char* hint = nullptr);

    // Re-insert a diagnostic captured earlier (memoized layout)
    void replay(const Diagnostic& d);

    int error_count() const;
    int warning_count() const;
    bool has_errors() const { return error_count() > 0; }

private:
    void push(Severity severity, SourceLoc loc, const char* msg, const char* hint);
};

} // namespace quire

#endif // QUIRE_FLOW_DIAG_HPP
