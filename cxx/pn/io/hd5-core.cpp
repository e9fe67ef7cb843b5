#include "hd5-core.hpp"

#include "../log/log.hpp"
#include "../types.hpp"

#include <hdf5.h>

namespace pn {
namespace HD5 {

namespace {

struct complex_d
{
  double r; /*real part*/
  double i; /*imaginary part*/
};

hid_t complex_did;

} // namespace

template <> hid_t type_impl(type_tag<Index>) { return H5T_NATIVE_LONG; }

template <> hid_t type_impl(type_tag<float>) { return H5T_NATIVE_FLOAT; }

template <> hid_t type_impl(type_tag<double>) { return H5T_NATIVE_DOUBLE; }

template <> hid_t type_impl(type_tag<std::complex<double>>) { return complex_did; }

/*
 * Allows real-valued datasets to be read straight into complex tensors. HDF5 wants the conversion in place, and the
 * buffer is sized for the larger type, so convert going backwards and nothing is overwritten before it is read.
 */
template <typename Real>
herr_t ConvertRealComplex(hid_t, hid_t, H5T_cdata_t *cdata, size_t n, size_t, size_t, void *buf, void *, hid_t)
{
  switch (cdata->command) {
  case H5T_CONV_INIT: cdata->need_bkg = H5T_BKG_NO; return 0;
  case H5T_CONV_FREE: return 0;
  case H5T_CONV_CONV: {
    Real const *src = static_cast<Real const *>(buf);
    Cxd        *tgt = static_cast<Cxd *>(buf);
    for (Index ii = static_cast<Index>(n) - 1; ii >= 0; ii--) {
      tgt[ii] = Cxd(src[ii]);
    }
    return 0;
  }
  default: return -1;
  }
}

void Init()
{
  static bool NeedsInit = true;

  if (NeedsInit) {
    auto err = H5open();
    err = H5Eset_auto(H5E_DEFAULT, nullptr, nullptr);
    if (err < 0) { throw Log::Failure("HD5", "Could not initialise HDF5, code: {}", err); }
    NeedsInit = false;
    hid_t did = type_impl(type_tag<double>{});

    // Same member names as h5py so files can be exchanged with numpy
    complex_did = H5Tcreate(H5T_COMPOUND, sizeof(complex_d));
    CheckedCall(H5Tinsert(complex_did, "r", HOFFSET(complex_d, r), did), "inserting .r");
    CheckedCall(H5Tinsert(complex_did, "i", HOFFSET(complex_d, i), did), "inserting .i");
    CheckedCall(H5Tregister(H5T_PERS_HARD, "float->complex", H5T_NATIVE_FLOAT, complex_did, ConvertRealComplex<float>),
                "registering float->complex");
    CheckedCall(H5Tregister(H5T_PERS_HARD, "double->complex", H5T_NATIVE_DOUBLE, complex_did, ConvertRealComplex<double>),
                "registering double->complex");

    Log::Debug("HD5", "Initialised HDF5");
  } else {
    Log::Debug("HD5", "Already initialised");
  }
}

// Saves the error at the top (bottom) of the stack in the supplied string
herr_t ErrorWalker(unsigned n, const H5E_error2_t *err_desc, void *data)
{
  std::string *str = (std::string *)data;
  if (n == 0) { *str = fmt::format("{}\n", err_desc->desc); }
  return 0;
}

std::string GetError()
{
  std::string error_string;
  H5Ewalk(H5Eget_current_stack(), H5E_WALK_UPWARD, &ErrorWalker, (void *)&error_string);
  return error_string;
}

void CheckedCall(herr_t status, std::string const &msg)
{
  if (status) { throw Log::Failure("HD5", "Error {}. Status {}. Error: {}\n", msg, status, GetError()); }
}

auto Exists(hid_t const parent, std::string const &name) -> bool { return (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0); }

} // namespace HD5
} // namespace pn
