#include "pn/errors.hpp"
#include "pn/noise/prewhiten.hpp"
#include "pn/tensors.hpp"

#include <random>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;
using namespace Catch;

namespace {
// Unit variance complex Gaussian, i.e. variance 1/2 in each of the real and imaginary parts
auto GaussianNoise(Index const nC, Index const nS, unsigned const seed) -> Eigen::MatrixXcd
{
  std::mt19937                     gen(seed);
  std::normal_distribution<double> dist(0., 1. / std::sqrt(2.));
  Eigen::MatrixXcd                 n(nC, nS);
  for (Index is = 0; is < nS; is++) {
    for (Index ic = 0; ic < nC; ic++) {
      n(ic, is) = Cxd(dist(gen), dist(gen));
    }
  }
  return n;
}
} // namespace

TEST_CASE("Noise", "[noise]")
{
  Index const nC = 4;

  SECTION("Covariance")
  {
    Eigen::MatrixXcd const n = GaussianNoise(nC, 64, 7);
    Eigen::MatrixXcd const C = Noise::Covariance(n);
    CHECK(C.rows() == nC);
    CHECK(C.cols() == nC);
    CHECK((C - C.adjoint()).norm() == Approx(0.).margin(1.e-12));
    CHECK(C(1, 2).real() == Approx((n.row(1) * n.row(2).adjoint())(0, 0).real() / 63.));
  }

  SECTION("Whitened noise has covariance 2 s I")
  {
    Eigen::MatrixXcd mix(nC, nC);
    mix << Cxd(1., 0.), Cxd(0.3, 0.2), Cxd(0., 0.), Cxd(0.1, 0.), //
      Cxd(0.2, -0.1), Cxd(2., 0.), Cxd(0.4, 0.), Cxd(0., 0.), //
      Cxd(0., 0.), Cxd(0.5, 0.5), Cxd(0.7, 0.), Cxd(0., -0.2), //
      Cxd(0., 0.3), Cxd(0., 0.), Cxd(0.1, 0.1), Cxd(1.5, 0.);
    Eigen::MatrixXcd const n = mix * GaussianNoise(nC, 500, 11);
    for (double const s : {1., 2.5}) {
      Eigen::MatrixXcd const W = Noise::WhiteningMatrix(n, s);
      Eigen::MatrixXcd const Cw = Noise::Covariance(W * n);
      Eigen::MatrixXcd const target = 2. * s * Eigen::MatrixXcd::Identity(nC, nC);
      CHECK((Cw - target).norm() == Approx(0.).margin(1.e-9));
    }

    // Same through the tensor path, with the samples split over two axes
    Cxd3 nt(nC, 25, 20);
    ChannelMatrix(nt) = n;
    Eigen::MatrixXcd const W = Noise::WhiteningMatrix<3>(nt, 2.5);
    Cxd3 const             white = Noise::Prewhiten<3>(nt, W);
    CHECK(white.dimension(1) == 25);
    CHECK(white.dimension(2) == 20);
    Eigen::MatrixXcd const Cw = Noise::Covariance(ChannelConstMatrix(white));
    CHECK((Cw - 5. * Eigen::MatrixXcd::Identity(nC, nC)).norm() == Approx(0.).margin(1.e-9));
  }

  SECTION("Unit variance noise")
  {
    Eigen::MatrixXcd const n = GaussianNoise(nC, 100, 42);
    Eigen::MatrixXcd const W = Noise::WhiteningMatrix(n);
    for (Index ii = 0; ii < nC; ii++) {
      for (Index ij = 0; ij < nC; ij++) {
        double const expected = (ii == ij) ? std::sqrt(2.) : 0.;
        CHECK(W(ii, ij).real() == Approx(expected).margin(0.6));
        CHECK(W(ii, ij).imag() == Approx(0.).margin(0.6));
      }
    }
    // Inverse of a lower triangle
    CHECK(W.triangularView<Eigen::StrictlyUpper>().toDenseMatrix().norm() == Approx(0.).margin(1.e-12));
  }

  SECTION("Tensor noise")
  {
    Cxd3 noise(nC, 10, 10);
    ChannelMatrix(noise) = GaussianNoise(nC, 100, 3);
    Eigen::MatrixXcd const Wt = Noise::WhiteningMatrix(noise);
    Eigen::MatrixXcd const Wm = Noise::WhiteningMatrix(ChannelConstMatrix(noise));
    CHECK((Wt - Wm).norm() == Approx(0.).margin(1.e-12));
  }

  SECTION("Bad noise")
  {
    CHECK_THROWS_AS(Noise::WhiteningMatrix(GaussianNoise(nC, 1, 5)), NotPositiveDefinite);
    CHECK_THROWS_AS(Noise::WhiteningMatrix(Eigen::MatrixXcd(nC, 0)), NotPositiveDefinite);
    Eigen::MatrixXcd n = GaussianNoise(nC, 50, 5);
    n.row(2).setZero();
    CHECK_THROWS_AS(Noise::WhiteningMatrix(n), NotPositiveDefinite);
    // Full rank, but too badly conditioned to whiten
    n = GaussianNoise(nC, 50, 5);
    n.row(1) *= 1.e-9;
    CHECK_THROWS_AS(Noise::WhiteningMatrix(n), NotPositiveDefinite);
    n = GaussianNoise(nC, 50, 5);
    n.row(1) *= 1.e-6;
    CHECK_NOTHROW(Noise::WhiteningMatrix(n));
    CHECK_THROWS_AS(Noise::WhiteningMatrix(GaussianNoise(nC, 50, 5), 0.), Log::Failure);
    CHECK_THROWS_AS(Noise::WhiteningMatrix(GaussianNoise(nC, 50, 5), -1.), Log::Failure);
  }

  SECTION("Prewhiten")
  {
    Eigen::MatrixXcd const W = Noise::WhiteningMatrix(GaussianNoise(nC, 200, 9));
    Cxd4                   data(nC, 3, 4, 5);
    data.setRandom();
    Cxd4 const white = Noise::Prewhiten<4>(data, W);
    CHECK(white.dimensions() == data.dimensions());
    Eigen::VectorXcd x(nC);
    for (Index ic = 0; ic < nC; ic++) {
      x(ic) = data(ic, 2, 1, 3);
    }
    Eigen::VectorXcd const y = W * x;
    for (Index ic = 0; ic < nC; ic++) {
      CHECK(std::abs(white(ic, 2, 1, 3) - y(ic)) == Approx(0.).margin(1.e-12));
    }

    Cxd2 const same = Noise::Prewhiten<2>(Cxd2(data.chip<3>(0).chip<2>(0)), Eigen::MatrixXcd::Identity(nC, nC));
    CHECK(Norm<false>(same - data.chip<3>(0).chip<2>(0)) == Approx(0.).margin(1.e-12));
  }

  SECTION("Shape mismatch")
  {
    Cxd3 data(nC, 4, 4);
    data.setRandom();
    CHECK_THROWS_AS(Noise::Prewhiten<3>(data, Eigen::MatrixXcd::Identity(nC + 1, nC + 1)), ShapeMismatch);
    CHECK_THROWS_AS(Noise::Prewhiten<3>(data, Eigen::MatrixXcd::Identity(nC, nC + 1)), ShapeMismatch);
  }
}
