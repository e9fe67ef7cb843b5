#pragma once

#include "log.hpp"

#include "../io/hd5-core.hpp"
#include "../types.hpp"

namespace pn {
namespace Log {

/*
 * Intermediate results (e.g. the smoothed covariance) can be dumped to an HDF5 file for inspection. Nothing is
 * written unless a debug file has been set.
 */
void SetDebugFile(std::string const &fname);
auto IsDebugging() -> bool;
void EndDebugging();

template <typename Scalar, int ND>
void Tensor(std::string const &name, Eigen::Tensor<Scalar, ND> const &x, HD5::DNames<size_t(ND)> const &dims);
void Matrix(std::string const &name, Eigen::MatrixXcd const &m);

} // namespace Log
} // namespace pn
