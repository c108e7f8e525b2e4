////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_export.h>

#include <mpscompat/backend/capabilities.hpp>

#include <ATen/Tensor.h>
#include <c10/util/ArrayRef.h>
#include <c10/util/string_view.h>

/** @file
 *
 *  Drop-in replacements for the ATen matrix-product primitives that
 *  keep working when complex operands live on a device that cannot
 *  multiply them (MPS, by default).
 *
 *  If any operand is on the restricted device and any operand is
 *  complex, the restricted-device operands are copied to the fallback
 *  device, the primitive runs there, and the result is copied back.
 *  Otherwise the primitive is called directly. Either way the result
 *  is what the primitive would have produced, on the device the
 *  caller used, and any error is the primitive's own.
 */

namespace mpscompat
{

/** @brief Einstein summation, see `at::einsum`. */
MPSCOMPAT_EXPORT at::Tensor
contract(c10::string_view equation,
         at::TensorList operands,
         DeviceCapabilities const& caps = default_capabilities());

/** @brief Broadcasting matrix product, see `at::matmul`. */
MPSCOMPAT_EXPORT at::Tensor
matmul(at::Tensor const& a,
       at::Tensor const& b,
       DeviceCapabilities const& caps = default_capabilities());

/** @brief Batched matrix product, see `at::bmm`. */
MPSCOMPAT_EXPORT at::Tensor
batched_matmul(at::Tensor const& a,
               at::Tensor const& b,
               DeviceCapabilities const& caps = default_capabilities());

/** @brief 2D matrix product, see `at::mm`. */
MPSCOMPAT_EXPORT at::Tensor
mm(at::Tensor const& a,
   at::Tensor const& b,
   DeviceCapabilities const& caps = default_capabilities());

/** @brief Would a call over these operands take the fallback path? */
MPSCOMPAT_EXPORT bool
needs_fallback(at::TensorList operands,
               DeviceCapabilities const& caps = default_capabilities());

}  // namespace mpscompat
