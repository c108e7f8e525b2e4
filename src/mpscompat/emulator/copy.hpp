////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ATen/Tensor.h>

namespace mpscompat::emulator
{

/** @brief Alias an emulated tensor as a CPU tensor.
 *
 *  Non-emulated tensors are returned as-is.
 *
 *  @post The storage of `t` reports the CPU device until
 *        sync_data_ptr_device(t) is called.
 */
at::Tensor alias_as_cpu(at::Tensor const& t);

/** @brief Re-tag a tensor whose memory we may claim as emulated. */
at::Tensor alias_as_emulated(at::Tensor const& t);

// aten::_copy_from(Tensor self, Tensor dst, bool non_blocking=False) -> Tensor
at::Tensor
copy_from(at::Tensor const& self, at::Tensor const& dst, bool non_blocking);

// aten::_copy_from_and_resize(Tensor self, Tensor dst) -> Tensor
at::Tensor copy_from_and_resize(at::Tensor const& self, at::Tensor const& dst);

}  // namespace mpscompat::emulator
