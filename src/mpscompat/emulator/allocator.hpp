////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_emulator_export.h>

#include <c10/core/Allocator.h>

namespace mpscompat::emulator
{

/** @class Allocator
 *  @brief Host memory, tagged as belonging to the emulated device.
 *
 *  Allocation and deallocation go through the current c10 CPU
 *  allocator; only the device recorded in the DataPtr differs.
 */
class MPSCOMPAT_EMULATOR_EXPORT Allocator final : public c10::Allocator
{
public:
  c10::DataPtr allocate(size_t n) final;
  c10::DeleterFnPtr raw_deleter() const final;
  void copy_data(void* dest, void const* src, std::size_t count) const final;
};  // class Allocator

MPSCOMPAT_EMULATOR_EXPORT Allocator& get_allocator();

}  // namespace mpscompat::emulator
