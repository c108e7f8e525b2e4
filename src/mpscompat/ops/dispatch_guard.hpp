////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat/backend/capabilities.hpp>
#include <mpscompat/types.hpp>
#include <mpscompat/utils/device_helpers.hpp>
#include <mpscompat/utils/logging.hpp>
#include <mpscompat/utils/tensor_helpers.hpp>

#include <ATen/Tensor.h>
#include <c10/util/ArrayRef.h>

#include <concepts>
#include <utility>

namespace mpscompat::detail
{

/** @brief A native primitive, adapted to take its tensor operands as
 *         a single list.
 */
template <typename F>
concept NativeOp = std::invocable<F const&, at::TensorList>;

/** @brief The guard shared by every wrapped primitive.
 *
 *  Fast path: `native_op(operands)` on the caller's tensors, nothing
 *  else. Fallback path: copy the restricted-device operands to the
 *  fallback device, run `native_op` there, and copy the result(s)
 *  back to the operative device.
 *
 *  Nothing here catches. Whatever `native_op` or a device copy throws
 *  reaches the caller as-is.
 */
template <NativeOp F>
auto guarded_call(char const* const op_name,
                  DeviceCapabilities const& caps,
                  at::TensorList operands,
                  F const& native_op)
{
  auto const operative = find_restricted_device(caps, operands);
  if (!operative
      || !lacks_support(caps, *operative, element_kind(operands)))
  {
    MPSCOMPAT_TRACE("{}: fast path", op_name);
    return native_op(operands);
  }

  MPSCOMPAT_DEBUG("{}: complex operands on {}, computing on {} (operands={})",
                  op_name,
                  operative->str(),
                  caps.fallback_device().str(),
                  to_str(operands));

  auto const relocated = relocate_to_fallback(caps, operands);
  return restore_device(native_op(at::TensorList {relocated}), *operative);
}

}  // namespace mpscompat::detail
