/*
 * threads.cpp
 *
 * Copyright (c) 2019 Tobias Wood
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "threads.hpp"

#include "../log/log.hpp"

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/CXX11/ThreadPool>

#include <memory>
#include <thread>

namespace pn {
namespace Threads {

namespace {
// The device refers to the pool, so they live and die together
struct Pool
{
  Pool(Index const nt)
    : pool(nt)
    , device(&pool, nt)
  {
  }

  Eigen::ThreadPool       pool;
  Eigen::ThreadPoolDevice device;
};

std::unique_ptr<Pool> global = nullptr;

auto Global() -> Pool &
{
  if (global == nullptr) { SetGlobalThreadCount(0); }
  return *global;
}
} // namespace

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::max<Index>(1, std::thread::hardware_concurrency()); }
  if (global && global->pool.NumThreads() == nt) { return; }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  global.reset();
  global = std::make_unique<Pool>(nt);
}

auto GlobalPool() -> Eigen::ThreadPool * { return &Global().pool; }

auto GlobalThreadCount() -> Index { return Global().pool.NumThreads(); }

auto TensorDevice() -> Eigen::ThreadPoolDevice & { return Global().device; }

} // namespace Threads
} // namespace pn
