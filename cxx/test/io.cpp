#include "pn/io/hd5.hpp"
#include "pn/log/debug.hpp"
#include "pn/log/log.hpp"
#include "pn/tensors.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pn;
using namespace Catch;

TEST_CASE("IO", "[io]")
{
  Index const nC = 3, M = 5;
  Cxd3        refData(nC, M, M + 1);
  refData.setRandom();

  SECTION("Basic")
  {
    std::filesystem::path const fname("test-basic.h5");
    { // Use destructor to ensure it is written
      HD5::Writer writer(fname);
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Data, refData.dimensions(), refData.data(), HD5::Dims::Channels2));
      CHECK(writer.exists(HD5::Keys::Data));
    }
    CHECK(std::filesystem::exists(fname));

    REQUIRE_NOTHROW(HD5::Reader(fname));
    HD5::Reader reader(fname);
    CHECK(reader.order() == 3);
    CHECK(reader.dimensions() == std::vector<Index>{nC, M, M + 1});
    auto const names = reader.readDNames<3>();
    CHECK(names[0] == "channel");
    CHECK(names[2] == "j");

    Cxd3 const check = reader.readTensor<Cxd3>();
    CHECK(Norm<false>(check - refData) == Approx(0.).margin(1.e-12));
    CHECK_THROWS_AS(reader.readTensor<Cxd4>(), Log::Failure);
    CHECK_THROWS_AS(reader.readTensor<Cxd3>("missing"), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Real-Data")
  {
    std::filesystem::path const fname("test-real.h5");
    {
      HD5::Writer writer(fname);
      Rd3 const   realData = refData.real();
      writer.writeTensor(HD5::Keys::Data, realData.dimensions(), realData.data(), HD5::Dims::Channels2);
    }
    HD5::Reader reader(fname);
    Cxd3 const  check = reader.readTensor<Cxd3>();
    CHECK(Norm<false>(check.real() - refData.real()) == Approx(0.).margin(1.e-12));
    CHECK(Norm<false>(check.imag()) == 0.);
    std::filesystem::remove(fname);
  }

  SECTION("Matrix")
  {
    std::filesystem::path const fname("test-matrix.h5");
    Eigen::MatrixXcd            W = Eigen::MatrixXcd::Random(nC, nC + 2);
    {
      HD5::Writer writer(fname);
      writer.writeTensor(HD5::Keys::Prewhiten, HD5::Shape<2>{W.rows(), W.cols()}, W.data(), HD5::Dims::Matrix);
    }
    HD5::Reader            reader(fname);
    Eigen::MatrixXcd const check = reader.readMatrix<Eigen::MatrixXcd>(HD5::Keys::Prewhiten);
    CHECK(check.rows() == nC);
    CHECK(check.cols() == nC + 2);
    CHECK((check - W).norm() == Approx(0.).margin(1.e-12));
    std::filesystem::remove(fname);
  }

  SECTION("Log")
  {
    std::filesystem::path const fname("test-log.h5");
    Log::Print("Test", "An entry with {} in it", 42);
    auto const saved = Log::Saved();
    REQUIRE(saved.size() > 0);
    {
      HD5::Writer writer(fname);
      writer.writeStrings(HD5::Keys::Log, saved);
    }
    HD5::Reader reader(fname);
    auto const  check = reader.readStrings(HD5::Keys::Log);
    CHECK(check == saved);
    CHECK(check.back().find("[Test  ] An entry with 42 in it") != std::string::npos);
    std::filesystem::remove(fname);
  }

  SECTION("Debug file")
  {
    std::filesystem::path const fname("test-debug.h5");
    Rd2 const                   plane = refData.chip<0>(0).real();
    Log::Tensor("plane", plane, HD5::Dims::Image2);
    CHECK(!std::filesystem::exists(fname));

    Log::SetDebugFile(fname);
    CHECK(Log::IsDebugging());
    Log::Tensor("plane", plane, HD5::Dims::Image2);
    Log::Tensor("plane", plane, HD5::Dims::Image2);
    Log::EndDebugging();
    CHECK(!Log::IsDebugging());

    HD5::Reader reader(fname);
    CHECK(reader.exists("plane"));
    CHECK(reader.exists("plane-1"));
    Cxd2 const check = reader.readTensor<Cxd2>("plane");
    CHECK(Norm<false>(check.real() - plane) == Approx(0.).margin(1.e-12));
    std::filesystem::remove(fname);
  }

  SECTION("Extension")
  {
    {
      HD5::Writer writer("test-ext.dat");
      writer.writeTensor(HD5::Keys::Data, refData.dimensions(), refData.data(), HD5::Dims::Channels2);
    }
    CHECK(std::filesystem::exists("test-ext.h5"));
    std::filesystem::remove("test-ext.h5");
  }
}
