#include "pn/coils/combine.hpp"
#include "pn/coils/walsh.hpp"
#include "pn/errors.hpp"
#include "pn/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;
using namespace Catch;

TEST_CASE("Combine", "[combine]")
{
  Index const nC = 3, M = 6;
  Cxd2        x(M, M);
  x.setRandom();

  SECTION("Recovers the image")
  {
    Cxd3 maps(nC, M, M);
    maps.setRandom();
    Cxd3 const images = maps * x.reshape(Sz3{1, M, M}).broadcast(Sz3{nC, 1, 1});
    Cxd2 const combined = Coils::Combine<2>(images, maps);
    CHECK(Norm<false>(combined - x) == Approx(0.).margin(1.e-10));
  }

  SECTION("Walsh maps")
  {
    Cxd1 s(nC);
    s.setValues({Cxd(1., 0.), Cxd(0., 0.5), Cxd(-0.3, 0.3)});
    Cxd3 const images =
      s.reshape(Sz3{nC, 1, 1}).broadcast(Sz3{1, M, M}) * x.reshape(Sz3{1, M, M}).broadcast(Sz3{nC, 1, 1});
    auto const walsh = Coils::Walsh<2>(images, Coils::WalshOpts{.window = 1});
    Cxd2 const combined = Coils::Combine<2>(images, walsh.maps);
    // Walsh maps are unit norm, so the magnitude is the root-sum-of-squares
    for (Index ij = 0; ij < M; ij++) {
      for (Index ii = 0; ii < M; ii++) {
        CHECK(std::abs(combined(ii, ij)) == Approx(std::sqrt(walsh.power(ii, ij))));
      }
    }
  }

  SECTION("Empty maps")
  {
    Cxd3 images(nC, M, M), maps(nC, M, M);
    images.setRandom();
    maps.setZero();
    Cxd2 const combined = Coils::Combine<2>(images, maps);
    CHECK(Norm<false>(combined) == 0.);
  }

  SECTION("Shape mismatch")
  {
    Cxd3 images(nC, M, M), maps(nC + 1, M, M);
    images.setRandom();
    maps.setRandom();
    CHECK_THROWS_AS(Coils::Combine<2>(images, maps), ShapeMismatch);
  }
}
