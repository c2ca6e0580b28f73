// flow_distribute.hpp - Distribution of children into one column
//
// The distributor consumes children from the work until the column is full,
// a break is requested or the children run out, then positions everything it
// accepted inside a frame.

#ifndef QUIRE_FLOW_DISTRIBUTE_HPP
#define QUIRE_FLOW_DISTRIBUTE_HPP

#include "flow_compose.hpp"

namespace quire {

// Fill one column. Returns None with the column frame in `out`, or a
// Relayout / Error stop raised by the composer.
Stop distribute(Composer& composer, const Regions& regions, FlowNode** out);

} // namespace quire

#endif // QUIRE_FLOW_DISTRIBUTE_HPP
