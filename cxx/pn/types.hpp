#pragma once

// This doesn't actually help with complex matrices as std::complex has no NaN
#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <algorithm>
#include <cassert>
#include <complex>
#include <functional>
#include <numeric>

using Index = Eigen::Index;

namespace pn {

// All arithmetic is in double precision. Data on disk in single precision is promoted when read
using Cxd = std::complex<double>;

// Real fields (power maps)
template <int N> using RdN = Eigen::Tensor<double, N>;
using Rd1 = RdN<1>;
using Rd2 = RdN<2>;
using Rd3 = RdN<3>;

// Complex fields, channel dimension first where there is one
template <int N> using CxdN = Eigen::Tensor<Cxd, N>;
using Cxd1 = CxdN<1>;
using Cxd2 = CxdN<2>;
using Cxd3 = CxdN<3>;
using Cxd4 = CxdN<4>;
using Cxd5 = CxdN<5>;
using Cxd6 = CxdN<6>;

template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz1 = Sz<1>;
using Sz2 = Sz<2>;
using Sz3 = Sz<3>;

//! Prepend dimensions, e.g. a channel dimension to an image shape
template <int N, typename... Args> auto AddFront(Sz<N> const &back, Args const... front) -> Sz<N + sizeof...(Args)>
{
  Sz<N + sizeof...(Args)> out;
  Index const             f[] = {static_cast<Index>(front)...};
  std::copy_n(f, sizeof...(Args), out.begin());
  std::copy_n(back.begin(), N, out.begin() + sizeof...(Args));
  return out;
}

//! Trailing (spatial) dimensions
template <size_t N, typename T> auto LastN(T const &sz) -> Sz<N>
{
  assert(N <= sz.size());
  Sz<N> last;
  std::copy_n(sz.end() - N, N, last.begin());
  return last;
}

template <size_t N> auto Product(std::array<Index, N> const &sz) -> Index
{
  return std::accumulate(sz.begin(), sz.end(), Index(1), std::multiplies<Index>());
}

} // namespace pn
