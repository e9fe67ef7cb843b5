#pragma once

#include "hd5-core.hpp"

#include <Eigen/Core>
#include <string>
#include <vector>

namespace pn {
namespace HD5 {

void SetDeflate(Index const d); //! Set the global compression (deflate) level, 0 is off

/*
 * Creates (or truncates) an HDF5 file. The extension is always replaced with .h5. Tensors are stored with their
 * dimensions reversed so numpy and friends see them in C order, and every dimension gets a label.
 */
struct Writer
{
  Writer(Writer const &) = delete;
  Writer(std::string const &fname);
  ~Writer();

  template <typename Scalar, size_t N>
  void writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims);
  void writeMatrix(std::string const &label, Eigen::MatrixXcd const &m, DNames<2> const &dims);
  void writeStrings(std::string const &label, std::vector<std::string> const &strings);

  auto exists(std::string const &name) const -> bool;

private:
  Handle handle_;
};

} // namespace HD5
} // namespace pn
