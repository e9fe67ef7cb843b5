#include "smooth.hpp"

#include "errors.hpp"
#include "log/log.hpp"
#include "sys/threads.hpp"

#include <vector>

namespace pn {

namespace {
// Window is clamped to n so only a single reflection is ever needed
inline auto Reflect(Index const i, Index const n) -> Index
{
  if (i < 0) {
    return -i - 1;
  } else if (i >= n) {
    return 2 * n - i - 1;
  } else {
    return i;
  }
}

/*
 * Box filter along one dimension of column-major data. stride is the product of the faster dimensions, n the size of
 * this dimension and outer the product of the slower ones.
 */
void BoxAlong(Cxd *data, Index const stride, Index const n, Index const outer, Index const w)
{
  Index const  before = w / 2;
  double const scale = 1. / w;
  auto         task = [&](Index const lo, Index const hi) {
    std::vector<Cxd> line(n);
    for (Index il = lo; il < hi; il++) {
      Cxd *const start = data + (il / stride) * stride * n + (il % stride);
      for (Index ii = 0; ii < n; ii++) {
        line[ii] = start[ii * stride];
      }
      for (Index ii = 0; ii < n; ii++) {
        Cxd sum = 0.;
        for (Index iw = 0; iw < w; iw++) {
          sum += line[Reflect(ii - before + iw, n)];
        }
        start[ii * stride] = sum * scale;
      }
    }
  };
  Threads::ChunkFor(task, stride * outer);
}

template <int R> void BoxDims(CxdN<R> &x, Index const window, Index const first)
{
  if (window < 1) { throw InvalidWindowSize("Smooth", "Window must be at least 1, was {}", window); }
  auto const shape = x.dimensions();
  if (x.size() == 0) { throw InvalidShape("Smooth", "Cannot smooth empty data with shape {}", shape); }
  for (Index id = first; id < R; id++) {
    Index const n = shape[id];
    Index       w = window;
    if (w > n) {
      Log::Warn("Smooth", "Window {} larger than dimension {} size {}, clamping", window, id, n);
      w = n;
    }
    if (w == 1) { continue; }
    Index const stride = std::accumulate(shape.begin(), shape.begin() + id, 1L, std::multiplies<Index>());
    Index const outer = std::accumulate(shape.begin() + id + 1, shape.end(), 1L, std::multiplies<Index>());
    BoxAlong(x.data(), stride, n, outer, w);
  }
}
} // namespace

template <int ND> auto Smooth(CxdN<ND> const &x, Index const window) -> CxdN<ND>
{
  static_assert(ND == 2 || ND == 3);
  Log::Debug("Smooth", "Shape {} window {}", x.dimensions(), window);
  CxdN<ND> y = x;
  BoxDims<ND>(y, window, 0);
  return y;
}

template auto Smooth<2>(Cxd2 const &, Index const) -> Cxd2;
template auto Smooth<3>(Cxd3 const &, Index const) -> Cxd3;

template <int ND> void SmoothBatch(CxdN<ND + 1> &x, Index const window)
{
  static_assert(ND == 2 || ND == 3);
  Log::Debug("Smooth", "{} planes of {} window {}", x.dimension(0), LastN<ND>(x.dimensions()), window);
  BoxDims<ND + 1>(x, window, 1);
}

template void SmoothBatch<2>(Cxd3 &, Index const);
template void SmoothBatch<3>(Cxd4 &, Index const);

} // namespace pn
