#pragma once

#include "../types.hpp"

namespace pn {
namespace Coils {

struct WalshOpts
{
  Index window = 5;     // Covariance smoothing window
  Index iterations = 3; // Power iterations, always run in full
  bool  strict = false; // Throw DegeneratePixel instead of zero-filling pixels with no signal
};

template <int ND> struct WalshMaps
{
  CxdN<ND + 1> maps;  // Coil first, unit norm over coils (zero at degenerate pixels)
  RdN<ND>      power; // Dominant eigenvalue of the smoothed covariance
};

auto PairCount(Index const nC) -> Index;
auto PairIndex(Index const p, Index const q, Index const nC) -> Index;

/*
 * Upper triangle (p <= q) of the coil covariance R(p, q) = x_p conj(x_q) at every pixel, pairs first. The lower
 * triangle is the conjugate so is not stored.
 */
template <int ND> auto PointwiseCovariance(CxdN<ND + 1> const &images) -> CxdN<ND + 1>;

/*
 * Walsh's adaptive coil sensitivity estimate. The pointwise covariance is box-smoothed, then at each pixel the
 * dominant eigenvector is found by a fixed number of power iterations starting from the row sums of the covariance.
 * If the row sums cancel, the column with the largest diagonal is used instead.
 *
 * Images are coil first, then 2 or 3 spatial dimensions.
 */
template <int ND> auto Walsh(CxdN<ND + 1> const &images, WalshOpts const &opts) -> WalshMaps<ND>;

} // namespace Coils
} // namespace pn
