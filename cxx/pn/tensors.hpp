#pragma once

#include "sys/threads.hpp"
#include "types.hpp"

namespace pn {

//! Inner product <a, b> = sum(a * conj(b)), optionally on the global thread pool
template <bool threads, typename T, typename U> auto Dot(T const &a, U const &b)
{
  using Scalar = typename std::remove_reference_t<T>::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>> d;
  if constexpr (threads) {
    d.device(Threads::TensorDevice()) = (a * b.conjugate()).sum();
  } else {
    d = (a * b.conjugate()).sum();
  }
  return Scalar(d());
}

template <bool threads, typename T> auto Norm(T const &a) { return std::sqrt(std::real(Dot<threads>(a, a))); }

//! Inner product along a single dimension, e.g. over channels
template <int D, typename T, typename U> auto DimDot(T const &x, U const &y)
{
  return (x * y.conjugate()).sum(Eigen::IndexList<Eigen::type2index<D>>());
}

/*
 * View a channel-first tensor as a (channels x everything else) matrix, so each column is the channel vector at one
 * sample or pixel.
 */
template <typename T> auto ChannelMatrix(T &t)
{
  using Matrix = Eigen::Matrix<typename T::Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  Index const rows = t.dimension(0);
  return Eigen::Map<Matrix>(t.data(), rows, rows ? t.size() / rows : 0);
}

template <typename T> auto ChannelConstMatrix(T const &t)
{
  using Matrix = Eigen::Matrix<typename T::Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  Index const rows = t.dimension(0);
  return Eigen::Map<Matrix const>(t.data(), rows, rows ? t.size() / rows : 0);
}

} // namespace pn
