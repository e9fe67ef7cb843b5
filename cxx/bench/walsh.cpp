#define CATCH_CONFIG_ENABLE_BENCHMARKING

#include "pn/coils/walsh.hpp"
#include "pn/smooth.hpp"
#include "pn/sys/threads.hpp"
#include <catch2/benchmark/catch_benchmark_all.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;

TEST_CASE("Walsh", "[Walsh]")
{
  Index const nC = 16, M = 128;
  Cxd3        images(nC, M, M);
  images.setRandom();

  BENCHMARK("Pointwise covariance") { return Coils::PointwiseCovariance<2>(images); };
  Cxd3 R = Coils::PointwiseCovariance<2>(images);
  BENCHMARK("Smooth covariance") { SmoothBatch<2>(R, 5); };
  BENCHMARK("Walsh") { return Coils::Walsh<2>(images, Coils::WalshOpts()); };

  Threads::SetGlobalThreadCount(1);
  BENCHMARK("Walsh single thread") { return Coils::Walsh<2>(images, Coils::WalshOpts()); };
  Threads::SetGlobalThreadCount(0);
}
