#include "writer.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace pn {
namespace HD5 {

namespace {
Index deflate = 2;

// HDF5 refuses chunks of 4 GiB or more. Halve the slowest dimensions until the chunk fits
template <size_t N> auto ChunkDims(std::array<hsize_t, N> dims, size_t const bytesPerElement) -> std::array<hsize_t, N>
{
  constexpr hsize_t maxBytes = (1UL << 32) - 1;
  auto              bytes = [&]() {
    hsize_t b = bytesPerElement;
    for (auto const d : dims) {
      b *= d;
    }
    return b;
  };
  for (size_t id = 0; id < N && bytes() > maxBytes; id++) {
    while (dims[id] > 1 && bytes() > maxBytes) {
      dims[id] = (dims[id] + 1) / 2;
    }
  }
  return dims;
}
} // namespace

void SetDeflate(Index const d)
{
  if (d < 0 || d > 9) { throw Log::Failure("HD5", "Deflate level must be 0-9, was {}", d); }
  deflate = d;
}

Writer::Writer(std::string const &fname)
{
  Init();
  auto const p = std::filesystem::path(fname).replace_extension(".h5");
  handle_ = H5Fcreate(p.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Could not create {}: {}", p.string(), GetError()); }
  Log::Print("HD5", "Writing {} id {}", p.string(), handle_);
}

Writer::~Writer()
{
  H5Fclose(handle_);
  Log::Debug("HD5", "Closed id {}", handle_);
}

auto Writer::exists(std::string const &name) const -> bool { return Exists(handle_, name); }

template <typename Scalar, size_t N>
void Writer::writeTensor(std::string const &name, Shape<N> const &shape, Scalar const *data, DNames<N> const &labels)
{
  if (Product(shape) == 0) { throw Log::Failure("HD5", "Tensor {} has an empty dimension, shape {}", name, shape); }

  // HDF5 is row-major, Eigen is column-major
  std::array<hsize_t, N> dims;
  std::copy(shape.rbegin(), shape.rend(), dims.begin());
  auto const chunks = ChunkDims(dims, sizeof(Scalar));

  hid_t const space = H5Screate_simple(N, dims.data(), NULL);
  hid_t const plist = H5Pcreate(H5P_DATASET_CREATE);
  CheckedCall(H5Pset_chunk(plist, N, chunks.data()), "setting chunk size");
  if (deflate > 0) { CheckedCall(H5Pset_deflate(plist, deflate), "setting deflate"); }

  hid_t const tid = type<Scalar>();
  hid_t const dset = H5Dcreate(handle_, name.c_str(), tid, space, H5P_DEFAULT, plist, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create {} with shape {}: {}", name, shape, GetError()); }
  for (size_t ii = 0; ii < N; ii++) {
    auto const &label = labels[N - 1 - ii];
    CheckedCall(H5DSset_label(dset, ii, label.c_str()), fmt::format("labelling {} dimension {} as {}", name, ii, label));
  }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, data), fmt::format("writing {}", name));
  CheckedCall(H5Pclose(plist), "closing property list");
  CheckedCall(H5Sclose(space), "closing dataspace");
  CheckedCall(H5Dclose(dset), "closing dataset");
  Log::Debug("HD5", "Wrote {} shape {}", name, shape);
}

template void Writer::writeTensor<double, 2>(std::string const &, Shape<2> const &, double const *, DNames<2> const &);
template void Writer::writeTensor<double, 3>(std::string const &, Shape<3> const &, double const *, DNames<3> const &);
template void Writer::writeTensor<Cxd, 2>(std::string const &, Shape<2> const &, Cxd const *, DNames<2> const &);
template void Writer::writeTensor<Cxd, 3>(std::string const &, Shape<3> const &, Cxd const *, DNames<3> const &);
template void Writer::writeTensor<Cxd, 4>(std::string const &, Shape<4> const &, Cxd const *, DNames<4> const &);
template void Writer::writeTensor<Cxd, 5>(std::string const &, Shape<5> const &, Cxd const *, DNames<5> const &);
template void Writer::writeTensor<Cxd, 6>(std::string const &, Shape<6> const &, Cxd const *, DNames<6> const &);

void Writer::writeMatrix(std::string const &label, Eigen::MatrixXcd const &m, DNames<2> const &dims)
{
  writeTensor(label, Shape<2>{m.rows(), m.cols()}, m.data(), dims);
}

void Writer::writeStrings(std::string const &label, std::vector<std::string> const &strings)
{
  if (strings.empty()) { return; }
  std::vector<char const *> ptrs;
  for (auto const &s : strings) {
    ptrs.push_back(s.c_str());
  }
  hsize_t const dims[1] = {strings.size()};
  hid_t const   space = H5Screate_simple(1, dims, NULL);
  hid_t const   tid = H5Tcopy(H5T_C_S1);
  CheckedCall(H5Tset_size(tid, H5T_VARIABLE), "setting string size");
  CheckedCall(H5Tset_cset(tid, H5T_CSET_UTF8), "setting string encoding");
  hid_t const dset = H5Dcreate(handle_, label.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create {}: {}", label, GetError()); }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()), fmt::format("writing {}", label));
  CheckedCall(H5Dclose(dset), "closing dataset");
  CheckedCall(H5Tclose(tid), "closing string type");
  CheckedCall(H5Sclose(space), "closing dataspace");
  Log::Debug("HD5", "Wrote {} strings to {}", strings.size(), label);
}

} // namespace HD5
} // namespace pn
