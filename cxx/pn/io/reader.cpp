#include "reader.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace pn {
namespace HD5 {

namespace {
// Dimensions in Eigen (column-major) order
auto SpaceDims(hid_t const space) -> std::vector<Index>
{
  int const            rank = H5Sget_simple_extent_ndims(space);
  std::vector<hsize_t> hdims(rank);
  H5Sget_simple_extent_dims(space, hdims.data(), NULL);
  return std::vector<Index>(hdims.rbegin(), hdims.rend());
}
} // namespace

Reader::Reader(std::string const &fname)
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not open {}: {}", fname, GetError()); }
  Log::Print("HD5", "Reading {} id {}", fname, handle_);
}

Reader::~Reader()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

auto Reader::open(std::string const &label) const -> Handle
{
  if (!exists(label)) { throw Log::Failure("HD5", "Dataset '{}' does not exist", label); }
  hid_t const dset = H5Dopen(handle_, label.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open dataset '{}': {}", label, GetError()); }
  return dset;
}

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

auto Reader::order(std::string const &label) const -> Index { return dimensions(label).size(); }

auto Reader::dimensions(std::string const &label) const -> std::vector<Index>
{
  hid_t const dset = open(label);
  hid_t const space = H5Dget_space(dset);
  auto const  dims = SpaceDims(space);
  CheckedCall(H5Sclose(space), "closing dataspace");
  CheckedCall(H5Dclose(dset), "closing dataset");
  return dims;
}

template <typename T> auto Reader::readTensor(std::string const &label) const -> T
{
  constexpr auto ND = T::NumDimensions;
  using Scalar = typename T::Scalar;
  auto const dims = dimensions(label);
  if (dims.size() != ND) { throw Log::Failure("HD5", "Dataset {} has order {}, expected {}", label, dims.size(), ND); }
  typename T::Dimensions shape;
  std::copy_n(dims.begin(), ND, shape.begin());
  T tensor(shape);

  hid_t const  dset = open(label);
  herr_t const status = H5Dread(dset, type<Scalar>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, tensor.data());
  CheckedCall(H5Dclose(dset), "closing dataset");
  if (status < 0) { throw Log::Failure("HD5", "Could not read {}: {}", label, GetError()); }
  Log::Debug("HD5", "Read {} shape {}", label, shape);
  return tensor;
}

template auto Reader::readTensor<Rd2>(std::string const &) const -> Rd2;
template auto Reader::readTensor<Rd3>(std::string const &) const -> Rd3;
template auto Reader::readTensor<Cxd2>(std::string const &) const -> Cxd2;
template auto Reader::readTensor<Cxd3>(std::string const &) const -> Cxd3;
template auto Reader::readTensor<Cxd4>(std::string const &) const -> Cxd4;
template auto Reader::readTensor<Cxd5>(std::string const &) const -> Cxd5;
template auto Reader::readTensor<Cxd6>(std::string const &) const -> Cxd6;

template <int N> auto Reader::readDNames(std::string const &label) const -> DNames<N>
{
  hid_t const dset = open(label);
  hid_t const space = H5Dget_space(dset);
  int const   rank = H5Sget_simple_extent_ndims(space);
  CheckedCall(H5Sclose(space), "closing dataspace");
  if (rank != N) {
    CheckedCall(H5Dclose(dset), "closing dataset");
    throw Log::Failure("HD5", "Asked for {} dimension names but {} has order {}", N, label, rank);
  }
  DNames<N> names;
  for (int ii = 0; ii < N; ii++) {
    char buffer[64] = {0};
    // Unlabelled dimensions leave the buffer empty
    H5DSget_label(dset, ii, buffer, sizeof(buffer));
    names[N - 1 - ii] = buffer;
  }
  CheckedCall(H5Dclose(dset), "closing dataset");
  return names;
}

template auto Reader::readDNames<2>(std::string const &) const -> DNames<2>;
template auto Reader::readDNames<3>(std::string const &) const -> DNames<3>;
template auto Reader::readDNames<4>(std::string const &) const -> DNames<4>;
template auto Reader::readDNames<5>(std::string const &) const -> DNames<5>;
template auto Reader::readDNames<6>(std::string const &) const -> DNames<6>;

template <typename Derived> auto Reader::readMatrix(std::string const &label) const -> Derived
{
  auto const dims = dimensions(label);
  if (dims.size() < 1 || dims.size() > 2) {
    throw Log::Failure("HD5", "Matrix {} has order {}, must be 1 or 2", label, dims.size());
  }
  Derived      matrix(dims[0], dims.size() == 2 ? dims[1] : 1);
  hid_t const  dset = open(label);
  herr_t const status = H5Dread(dset, type<typename Derived::Scalar>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, matrix.data());
  CheckedCall(H5Dclose(dset), "closing dataset");
  if (status < 0) { throw Log::Failure("HD5", "Could not read {}: {}", label, GetError()); }
  Log::Debug("HD5", "Read matrix {} {}x{}", label, matrix.rows(), matrix.cols());
  return matrix;
}

template auto Reader::readMatrix<Eigen::MatrixXcd>(std::string const &) const -> Eigen::MatrixXcd;

auto Reader::readStrings(std::string const &label) const -> std::vector<std::string>
{
  auto const dims = dimensions(label);
  if (dims.size() != 1) { throw Log::Failure("HD5", "Strings {} have order {}, must be 1", label, dims.size()); }
  hid_t const tid = H5Tcopy(H5T_C_S1);
  CheckedCall(H5Tset_size(tid, H5T_VARIABLE), "setting string size");
  CheckedCall(H5Tset_cset(tid, H5T_CSET_UTF8), "setting string encoding");
  std::vector<char *> buffers(dims[0], nullptr);
  hid_t const         dset = open(label);
  hid_t const         space = H5Dget_space(dset);
  herr_t const        status = H5Dread(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffers.data());
  std::vector<std::string> strings;
  if (status >= 0) {
    for (auto const b : buffers) {
      strings.emplace_back(b ? b : "");
    }
    CheckedCall(H5Dvlen_reclaim(tid, space, H5P_DEFAULT, buffers.data()), "releasing strings");
  }
  CheckedCall(H5Sclose(space), "closing dataspace");
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Tclose(tid), "closing string type");
  if (status < 0) { throw Log::Failure("HD5", "Could not read {}: {}", label, GetError()); }
  return strings;
}

} // namespace HD5
} // namespace pn
