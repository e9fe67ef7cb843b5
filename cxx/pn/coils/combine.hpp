#pragma once

#include "../types.hpp"

namespace pn {
namespace Coils {

/*
 * Optimal (Roemer) combination of coil images with sensitivity maps, sum(x conj(S)) / sum(|S|^2) over the coil
 * dimension. Pixels where every map is zero combine to zero.
 */
template <int ND> auto Combine(CxdN<ND + 1> const &images, CxdN<ND + 1> const &maps) -> CxdN<ND>;

} // namespace Coils
} // namespace pn
