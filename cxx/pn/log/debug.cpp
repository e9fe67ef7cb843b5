#include "debug.hpp"

#include "../io/writer.hpp"

#include <memory>

namespace pn {
namespace Log {

namespace {
std::unique_ptr<HD5::Writer> debugFile = nullptr;

// Repeated calls (e.g. one per volume) get a numeric suffix
auto UniqueName(std::string const &name) -> std::string
{
  std::string unique = name;
  for (Index ii = 1; debugFile->exists(unique); ii++) {
    unique = fmt::format("{}-{}", name, ii);
  }
  return unique;
}
} // namespace

void SetDebugFile(std::string const &fname)
{
  debugFile = std::make_unique<HD5::Writer>(fname);
  Log::Print("Debug", "Writing intermediate results to {}", fname);
}

auto IsDebugging() -> bool { return debugFile != nullptr; }

void EndDebugging() { debugFile.reset(); }

template <typename Scalar, int ND>
void Tensor(std::string const &name, Eigen::Tensor<Scalar, ND> const &x, HD5::DNames<size_t(ND)> const &dims)
{
  if (IsDebugging()) { debugFile->writeTensor(UniqueName(name), x.dimensions(), x.data(), dims); }
}

template void Tensor(std::string const &, Rd2 const &, HD5::DNames<2> const &);
template void Tensor(std::string const &, Rd3 const &, HD5::DNames<3> const &);
template void Tensor(std::string const &, Cxd3 const &, HD5::DNames<3> const &);
template void Tensor(std::string const &, Cxd4 const &, HD5::DNames<4> const &);

void Matrix(std::string const &name, Eigen::MatrixXcd const &m)
{
  if (IsDebugging()) { debugFile->writeMatrix(UniqueName(name), m, HD5::Dims::Matrix); }
}

} // namespace Log
} // namespace pn
