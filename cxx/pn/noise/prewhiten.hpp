#pragma once

#include "../tensors.hpp"
#include "../types.hpp"

namespace pn {
namespace Noise {

/*
 * Sample covariance of noise-only data, C = N N^H / (M - 1), where N is channels x samples. Samples are assumed to be
 * zero-mean so no mean is removed. Throws NotPositiveDefinite if there are fewer than 2 samples.
 */
auto Covariance(Eigen::Ref<Eigen::MatrixXcd const> const &noise) -> Eigen::MatrixXcd;

/*
 * Whitening matrix from a noise covariance. With C = L L^H this is sqrt(2 scale) L^-1, so whitened noise has unit
 * variance in each of the real and imaginary parts. scale is (acquisition dwell / noise dwell) * receiver bandwidth
 * ratio.
 *
 * Throws NotPositiveDefinite unless every diagonal entry of L exceeds nC sqrt(eps) times the largest. This also
 * rejects covariances that are positive definite but have a condition number beyond roughly 1 / (nC^2 eps), e.g. a
 * channel whose noise amplitude is 1e-9 of the others.
 */
auto CholeskyWhitening(Eigen::MatrixXcd const &C, double const scale = 1.0) -> Eigen::MatrixXcd;

//! Covariance followed by CholeskyWhitening
auto WhiteningMatrix(Eigen::Ref<Eigen::MatrixXcd const> const &noise, double const scale = 1.0) -> Eigen::MatrixXcd;

//! Noise with channels first and any number of trailing dimensions, which are treated as samples
template <int N> auto WhiteningMatrix(CxdN<N> const &noise, double const scale = 1.0) -> Eigen::MatrixXcd
{
  return WhiteningMatrix(ChannelConstMatrix(noise), scale);
}

/*
 * Left-multiply the channel dimension (first) of data by W. Throws ShapeMismatch if W is not square or does not
 * match the number of channels.
 */
template <int N> auto Prewhiten(CxdN<N> const &data, Eigen::MatrixXcd const &W) -> CxdN<N>;

} // namespace Noise
} // namespace pn
