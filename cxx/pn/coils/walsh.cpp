#include "walsh.hpp"

#include "../errors.hpp"
#include "../io/hd5-core.hpp"
#include "../log/debug.hpp"
#include "../smooth.hpp"
#include "../sys/threads.hpp"
#include "../tensors.hpp"

#include <atomic>
#include <cmath>

namespace pn {
namespace Coils {

auto PairCount(Index const nC) -> Index { return nC * (nC + 1) / 2; }

auto PairIndex(Index const p, Index const q, Index const nC) -> Index
{
  assert(p <= q && q < nC);
  return p * nC - (p * (p - 1)) / 2 + (q - p);
}

template <int ND> auto PointwiseCovariance(CxdN<ND + 1> const &images) -> CxdN<ND + 1>
{
  Index const  nC = images.dimension(0);
  Index const  nP = PairCount(nC);
  CxdN<ND + 1> R(AddFront(LastN<ND>(images.dimensions()), nP));
  auto const   x = ChannelConstMatrix(images);
  auto         r = ChannelMatrix(R);
  auto         task = [&](Index const lo, Index const hi) {
    for (Index iv = lo; iv < hi; iv++) {
      for (Index ip = 0; ip < nC; ip++) {
        for (Index iq = ip; iq < nC; iq++) {
          r(PairIndex(ip, iq, nC), iv) = x(ip, iv) * std::conj(x(iq, iv));
        }
      }
    }
  };
  Threads::ChunkFor(task, x.cols());
  return R;
}

template auto PointwiseCovariance<2>(Cxd3 const &) -> Cxd3;
template auto PointwiseCovariance<3>(Cxd4 const &) -> Cxd4;

namespace {
inline auto Degenerate(double const λ) -> bool { return !(λ > 0.) || !std::isfinite(λ); }
} // namespace

template <int ND> auto Walsh(CxdN<ND + 1> const &images, WalshOpts const &opts) -> WalshMaps<ND>
{
  static_assert(ND == 2 || ND == 3);
  auto const  shape = images.dimensions();
  auto const  ishape = LastN<ND>(shape);
  Index const nC = shape[0];
  Index const nV = Product(ishape);
  if (nC < 1 || nV < 1) { throw InvalidShape("Walsh", "Images must have at least one channel and pixel, shape was {}", shape); }
  if (opts.iterations < 0) { throw Log::Failure("Walsh", "Iterations must not be negative, was {}", opts.iterations); }

  Log::Print("Walsh", "Channels {} matrix {} window {} iterations {}", nC, ishape, opts.window, opts.iterations);
  auto const   start = Log::Now();
  CxdN<ND + 1> R = PointwiseCovariance<ND>(images);
  SmoothBatch<ND>(R, opts.window);
  if constexpr (ND == 2) {
    Log::Tensor("walsh-covariance", R, HD5::Dims::Pairs2);
  } else {
    Log::Tensor("walsh-covariance", R, HD5::Dims::Pairs3);
  }

  WalshMaps<ND> result{.maps = CxdN<ND + 1>(shape), .power = RdN<ND>(ishape)};
  auto const    r = ChannelConstMatrix(R);
  auto          s = ChannelMatrix(result.maps);
  double *const ρ = result.power.data();

  std::atomic<Index> degenerate = 0;
  auto               task = [&](Index const lo, Index const hi) {
    Eigen::MatrixXcd Rp(nC, nC);
    Eigen::VectorXcd v(nC);
    Index            nD = 0;
    for (Index iv = lo; iv < hi; iv++) {
      for (Index ip = 0; ip < nC; ip++) {
        Rp(ip, ip) = r(PairIndex(ip, ip, nC), iv);
        for (Index iq = ip + 1; iq < nC; iq++) {
          Rp(ip, iq) = r(PairIndex(ip, iq, nC), iv);
          Rp(iq, ip) = std::conj(Rp(ip, iq));
        }
      }

      v = Rp.rowwise().sum();
      double λ = v.norm();
      if (λ == 0.) {
        // Row sums cancel when the channel responses sum to zero. Any non-zero column of R is in its range instead
        Index ic;
        if (Rp.diagonal().real().maxCoeff(&ic) > 0.) {
          v = Rp.col(ic);
          λ = v.norm();
        }
      }
      bool   ok = !Degenerate(λ);
      for (Index ii = 0; ok && ii <= opts.iterations; ii++) {
        v /= λ;
        if (ii < opts.iterations) {
          v = Rp * v;
          λ = v.norm();
          ok = !Degenerate(λ);
        }
      }

      if (ok) {
        s.col(iv) = v;
        ρ[iv] = λ;
      } else {
        s.col(iv).setZero();
        ρ[iv] = 0.;
        nD++;
      }
    }
    degenerate += nD;
  };
  Threads::ChunkFor(task, nV);

  if (degenerate > 0) {
    if (opts.strict) {
      throw DegeneratePixel("Walsh", "{} of {} pixels had a zero or non-finite covariance", degenerate.load(), nV);
    } else {
      Log::Print("Walsh", "{} of {} pixels had a zero or non-finite covariance, maps set to zero there", degenerate.load(), nV);
    }
  }
  if constexpr (ND == 2) {
    Log::Tensor("walsh-power", result.power, HD5::Dims::Image2);
  } else {
    Log::Tensor("walsh-power", result.power, HD5::Dims::Image3);
  }
  Log::Print("Walsh", "Finished in {}", Log::ToNow(start));
  return result;
}

template auto Walsh<2>(Cxd3 const &, WalshOpts const &) -> WalshMaps<2>;
template auto Walsh<3>(Cxd4 const &, WalshOpts const &) -> WalshMaps<3>;

} // namespace Coils
} // namespace pn
