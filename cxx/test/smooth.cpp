#include "pn/errors.hpp"
#include "pn/smooth.hpp"
#include "pn/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;
using namespace Catch;

TEST_CASE("Smooth", "[smooth]")
{
  SECTION("Window 1 is identity")
  {
    Cxd2 x(6, 5);
    x.setRandom();
    Cxd2 const y = Smooth<2>(x, 1);
    CHECK(Norm<false>(y - x) == 0.);
    Cxd2 const yy = Smooth<2>(y, 1);
    CHECK(Norm<false>(yy - y) == 0.);
  }

  SECTION("Reflected edges")
  {
    Cxd2 x(4, 1);
    x.setValues({{1.}, {2.}, {3.}, {4.}});
    Cxd2 const y3 = Smooth<2>(x, 3);
    CHECK(y3(0, 0).real() == Approx(4. / 3.));
    CHECK(y3(1, 0).real() == Approx(2.));
    CHECK(y3(2, 0).real() == Approx(3.));
    CHECK(y3(3, 0).real() == Approx(11. / 3.));
    CHECK(std::abs(y3(0, 0).imag()) == 0.);

    // Even windows take the extra sample from before
    Cxd2 const y2 = Smooth<2>(x, 2);
    CHECK(y2(0, 0).real() == Approx(1.));
    CHECK(y2(1, 0).real() == Approx(1.5));
    CHECK(y2(2, 0).real() == Approx(2.5));
    CHECK(y2(3, 0).real() == Approx(3.5));
  }

  SECTION("Constant fields are unchanged")
  {
    Cxd2 x(6, 7);
    x.setConstant(Cxd(2., -1.));
    Cxd2 const y = Smooth<2>(x, 5);
    CHECK(Norm<false>(y - x) == Approx(0.).margin(1.e-12));

    Cxd3 x3(3, 4, 5);
    x3.setConstant(Cxd(0., 3.));
    Cxd3 const y3 = Smooth<3>(x3, 3);
    CHECK(Norm<false>(y3 - x3) == Approx(0.).margin(1.e-12));
  }

  SECTION("Commutes with conjugation")
  {
    Cxd2 x(8, 8);
    x.setRandom();
    Cxd2 const a = Smooth<2>(x, 3).conjugate();
    Cxd2 const b = Smooth<2>(Cxd2(x.conjugate()), 3);
    CHECK(Norm<false>(a - b) == Approx(0.).margin(1.e-12));
  }

  SECTION("Large windows are clamped")
  {
    Cxd2 x(4, 4);
    x.setRandom();
    Cxd2 const big = Smooth<2>(x, 10);
    Cxd2 const clamped = Smooth<2>(x, 4);
    CHECK(Norm<false>(big - clamped) == Approx(0.).margin(1.e-12));
  }

  SECTION("Bad arguments")
  {
    Cxd2 x(4, 4);
    x.setRandom();
    CHECK_THROWS_AS(Smooth<2>(x, 0), InvalidWindowSize);
    CHECK_THROWS_AS(Smooth<2>(x, -3), InvalidWindowSize);
    Cxd2 empty(0, 4);
    CHECK_THROWS_AS(Smooth<2>(empty, 3), InvalidShape);
  }

  SECTION("Batch")
  {
    Cxd3 x(3, 7, 6);
    x.setRandom();
    Cxd3 y = x;
    SmoothBatch<2>(y, 3);
    for (Index ib = 0; ib < 3; ib++) {
      Cxd2 const plane = Smooth<2>(Cxd2(x.chip<0>(ib)), 3);
      CHECK(Norm<false>(Cxd2(y.chip<0>(ib)) - plane) == Approx(0.).margin(1.e-12));
    }
  }
}
