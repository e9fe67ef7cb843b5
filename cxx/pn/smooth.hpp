#pragma once

#include "types.hpp"

namespace pn {

/*
 * Box (uniform) filter. Each output sample is the unweighted mean of the window of samples centred on it along every
 * dimension. For an even window the extra sample comes from before, i.e. the window is [i - w/2, i - w/2 + w - 1].
 * Edges are reflected about the half-sample boundary (d c b a | a b c d | d c b a).
 *
 * The weights are real so the real and imaginary parts are smoothed independently. A window larger than a dimension
 * is clamped to that dimension. Throws InvalidWindowSize if window < 1.
 */
template <int ND> auto Smooth(CxdN<ND> const &x, Index const window) -> CxdN<ND>;

//! Smooth every plane of x in place, where the first dimension is a batch dimension (e.g. coil pairs)
template <int ND> void SmoothBatch(CxdN<ND + 1> &x, Index const window);

} // namespace pn
