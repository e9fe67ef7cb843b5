#include "combine.hpp"

#include "../errors.hpp"
#include "../sys/threads.hpp"
#include "../tensors.hpp"

namespace pn {
namespace Coils {

template <int ND> auto Combine(CxdN<ND + 1> const &images, CxdN<ND + 1> const &maps) -> CxdN<ND>
{
  static_assert(ND == 2 || ND == 3);
  if (images.dimensions() != maps.dimensions()) {
    throw ShapeMismatch("Combine", "Image shape {} does not match maps {}", images.dimensions(), maps.dimensions());
  }
  auto const shape = LastN<ND>(images.dimensions());
  Log::Print("Combine", "Combining {} channels, matrix {}", images.dimension(0), shape);
  CxdN<ND> num(shape), den(shape);
  num.device(Threads::TensorDevice()) = DimDot<0>(images, maps);
  den.device(Threads::TensorDevice()) = DimDot<0>(maps, maps);
  CxdN<ND> combined(shape);
  combined.device(Threads::TensorDevice()) = (den.abs() > 0.).select(num / den, den.constant(0.));
  return combined;
}

template auto Combine<2>(Cxd3 const &, Cxd3 const &) -> Cxd2;
template auto Combine<3>(Cxd4 const &, Cxd4 const &) -> Cxd3;

} // namespace Coils
} // namespace pn
