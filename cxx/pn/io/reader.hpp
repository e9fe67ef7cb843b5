#pragma once

#include "hd5-core.hpp"

#include <string>
#include <vector>

namespace pn {
namespace HD5 {

/*
 * Reads tensors, matrices and strings out of HDF5 files. Real-valued datasets can be read into complex tensors, and
 * single precision is promoted to double.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(std::string const &fname);
  ~Reader();

  auto exists(std::string const &label = Keys::Data) const -> bool;
  auto order(std::string const &label = Keys::Data) const -> Index;
  auto dimensions(std::string const &label = Keys::Data) const -> std::vector<Index>;

  template <typename T> auto       readTensor(std::string const &label = Keys::Data) const -> T;
  template <int N> auto            readDNames(std::string const &label = Keys::Data) const -> DNames<N>;
  template <typename Derived> auto readMatrix(std::string const &label) const -> Derived;
  auto                             readStrings(std::string const &label) const -> std::vector<std::string>;

private:
  auto   open(std::string const &label) const -> Handle;
  Handle handle_;
};

} // namespace HD5
} // namespace pn
