////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_emulator_export.h>

#include <ATen/core/TensorBase.h>
#include <c10/core/Device.h>
#include <c10/core/Layout.h>
#include <c10/core/MemoryFormat.h>
#include <c10/core/ScalarType.h>
#include <c10/util/ArrayRef.h>

#include <optional>

namespace mpscompat::emulator
{

/** @brief Allocate an uninitialized tensor on the emulated device.
 *
 *  Any dtype is accepted; the restriction the emulator models lives
 *  in the matrix-product kernels, not in storage. `dtype_opt`
 *  defaults to the global default dtype and `device_opt` to
 *  "mpsemu:0".
 */
MPSCOMPAT_EMULATOR_EXPORT at::TensorBase
empty_emulated(c10::IntArrayRef size,
               std::optional<c10::ScalarType> dtype_opt,
               std::optional<c10::Layout> layout_opt,
               std::optional<c10::Device> device_opt,
               std::optional<bool> pin_memory_opt,
               std::optional<c10::MemoryFormat> memory_format_opt);

MPSCOMPAT_EMULATOR_EXPORT at::TensorBase
empty_strided_emulated(c10::IntArrayRef size,
                       c10::IntArrayRef stride,
                       std::optional<c10::ScalarType> dtype_opt,
                       std::optional<c10::Layout> layout_opt,
                       std::optional<c10::Device> device_opt,
                       std::optional<bool> pin_memory_opt);

}  // namespace mpscompat::emulator
