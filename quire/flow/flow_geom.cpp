// flow_geom.cpp - Region sequence implementation

#include "flow_geom.hpp"

namespace quire {

Regions Regions::one(Size size, Expand expand) {
    Regions r;
    r.size = size;
    r.full = size.y;
    r.backlog = nullptr;
    r.backlog_len = 0;
    r.last = 0;
    r.has_last = false;
    r.expand = expand;
    return r;
}

Regions Regions::repeat(Size size, Expand expand) {
    Regions r = one(size, expand);
    r.last = size.y;
    r.has_last = true;
    return r;
}

bool Regions::nth_height(int n, float* out) const {
    if (n == 0) {
        *out = size.y;
        return true;
    }
    if (n - 1 < backlog_len) {
        *out = backlog[n - 1];
        return true;
    }
    if (has_last) {
        *out = last;
        return true;
    }
    return false;
}

void Regions::next() {
    if (backlog_len > 0) {
        size.y = backlog[0];
        full = backlog[0];
        backlog++;
        backlog_len--;
    } else if (has_last) {
        size.y = last;
        full = last;
    }
}

} // namespace quire
