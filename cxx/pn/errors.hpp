#pragma once

#include "log/log.hpp"

/*
 * Specific failures so callers (and tests) can tell them apart. All are Log::Failure, so the front end reports them
 * the same way.
 */

namespace pn {

//! Wrong rank, empty dimensions or a mismatched coil axis
struct InvalidShape : Log::Failure
{
  using Log::Failure::Failure;
};

//! Smoothing window that is not positive
struct InvalidWindowSize : Log::Failure
{
  using Log::Failure::Failure;
};

//! Covariance that cannot be Cholesky factorized, including too few samples to estimate it
struct NotPositiveDefinite : Log::Failure
{
  using Log::Failure::Failure;
};

//! Whitening matrix that does not fit the data's coil axis
struct ShapeMismatch : Log::Failure
{
  using Log::Failure::Failure;
};

//! Pixel with a zero-norm covariance, only raised when asked to be strict
struct DegeneratePixel : Log::Failure
{
  using Log::Failure::Failure;
};

} // namespace pn
