#include "prewhiten.hpp"

#include "../errors.hpp"
#include "../log/debug.hpp"

#include <Eigen/Cholesky>
#include <cmath>
#include <limits>

namespace pn {
namespace Noise {

auto Covariance(Eigen::Ref<Eigen::MatrixXcd const> const &noise) -> Eigen::MatrixXcd
{
  Index const nC = noise.rows();
  Index const M = noise.cols();
  if (nC < 1) { throw InvalidShape("Noise", "Noise data had no channels"); }
  if (M < 2) { throw NotPositiveDefinite("Noise", "Need at least 2 noise samples to estimate a covariance, had {}", M); }
  Log::Print("Noise", "Covariance of {} channels from {} samples", nC, M);
  Eigen::MatrixXcd C = (noise * noise.adjoint()) / double(M - 1);
  Log::Matrix("noise-covariance", C);
  return C;
}

auto CholeskyWhitening(Eigen::MatrixXcd const &C, double const scale) -> Eigen::MatrixXcd
{
  if (C.rows() != C.cols()) { throw ShapeMismatch("Noise", "Covariance must be square, was {}x{}", C.rows(), C.cols()); }
  if (!(scale > 0.) || !std::isfinite(scale)) { throw Log::Failure("Noise", "Scale must be positive, was {}", scale); }
  Index const nC = C.rows();

  Eigen::LLT<Eigen::MatrixXcd> const llt(C);
  if (llt.info() != Eigen::Success) { throw NotPositiveDefinite("Noise", "Cholesky factorization of covariance failed"); }
  Eigen::MatrixXcd const L = llt.matrixL();
  // LLT only fails on a non-positive pivot. A rank-deficient covariance can leave pivots of order eps instead, which
  // become diagonal entries of order sqrt(eps) in L
  Eigen::ArrayXd const d = L.diagonal().real().array();
  double const         tol = std::sqrt(std::numeric_limits<double>::epsilon()) * nC * d.maxCoeff();
  if (!d.allFinite() || d.minCoeff() <= tol) {
    throw NotPositiveDefinite("Noise", "Covariance is singular, Cholesky diagonal range {} to {}", d.minCoeff(), d.maxCoeff());
  }
  Log::Debug("Noise", "Cholesky diagonal range {} to {}", d.minCoeff(), d.maxCoeff());

  Eigen::MatrixXcd W = L.triangularView<Eigen::Lower>().solve(Eigen::MatrixXcd::Identity(nC, nC));
  W *= std::sqrt(2. * scale);
  Log::Print("Noise", "Whitening matrix {}x{} scale {}", nC, nC, scale);
  return W;
}

auto WhiteningMatrix(Eigen::Ref<Eigen::MatrixXcd const> const &noise, double const scale) -> Eigen::MatrixXcd
{
  return CholeskyWhitening(Covariance(noise), scale);
}

template <int N> auto Prewhiten(CxdN<N> const &data, Eigen::MatrixXcd const &W) -> CxdN<N>
{
  Index const nC = data.dimension(0);
  if (W.rows() != W.cols()) { throw ShapeMismatch("Prewhiten", "Whitening matrix must be square, was {}x{}", W.rows(), W.cols()); }
  if (W.cols() != nC) {
    throw ShapeMismatch("Prewhiten", "Data has {} channels but whitening matrix has {}", nC, W.cols());
  }
  Log::Print("Prewhiten", "Prewhitening {} channels, shape {}", nC, data.dimensions());
  CxdN<N>    white(data.dimensions());
  auto const datamat = ChannelConstMatrix(data);
  auto       whitemat = ChannelMatrix(white);
  whitemat.noalias() = W * datamat;
  return white;
}

template auto Prewhiten<2>(Cxd2 const &, Eigen::MatrixXcd const &) -> Cxd2;
template auto Prewhiten<3>(Cxd3 const &, Eigen::MatrixXcd const &) -> Cxd3;
template auto Prewhiten<4>(Cxd4 const &, Eigen::MatrixXcd const &) -> Cxd4;
template auto Prewhiten<5>(Cxd5 const &, Eigen::MatrixXcd const &) -> Cxd5;
template auto Prewhiten<6>(Cxd6 const &, Eigen::MatrixXcd const &) -> Cxd6;

} // namespace Noise
} // namespace pn
