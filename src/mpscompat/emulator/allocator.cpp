////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "allocator.hpp"

#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/logging.hpp>

#include <c10/core/CPUAllocator.h>

namespace mpscompat::emulator
{

c10::DataPtr Allocator::allocate(size_t n)
{
  c10::DataPtr dp = c10::GetCPUAllocator()->allocate(n);
  MPSCOMPAT_TRACE("emulator::Allocator::allocate(n={}, ptr={})", n, dp.get());
  dp.unsafe_set_device(device());
  return dp;
}

c10::DeleterFnPtr Allocator::raw_deleter() const
{
  return c10::GetCPUAllocator()->raw_deleter();
}

void Allocator::copy_data(void* const dest,
                          void const* const src,
                          std::size_t const count) const
{
  default_copy_data(dest, src, count);
}

Allocator& get_allocator()
{
  static Allocator alloc;
  return alloc;
}

}  // namespace mpscompat::emulator
