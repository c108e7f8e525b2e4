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
#include <c10/core/Device.h>
#include <c10/util/ArrayRef.h>

#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace mpscompat
{

/** @brief Find the operative restricted device, if any.
 *
 *  Returns the device of the first defined operand that lives on the
 *  restricted accelerator, or nullopt if none does.
 */
inline std::optional<c10::Device>
find_restricted_device(DeviceCapabilities const& caps,
                       at::TensorList operands) noexcept
{
  for (auto const& t : operands)
    if (t.defined() && is_restricted(caps, t.device()))
      return t.device();
  return std::nullopt;
}

/** @brief Copy restricted-device operands to the fallback device.
 *
 *  Operands that are undefined or already off the restricted device
 *  are passed through as-is (a shallow, refcounted copy). Dtype and
 *  shape are never changed.
 */
MPSCOMPAT_EXPORT std::vector<at::Tensor>
relocate_to_fallback(DeviceCapabilities const& caps, at::TensorList operands);

/** @name Moving results back to the operative device */
///@{

inline at::Tensor restore_device(at::Tensor const& t, c10::Device const& d)
{
  if (!t.defined())
    return t;
  return t.to(d);
}

inline std::vector<at::Tensor> restore_device(std::vector<at::Tensor> const& ts,
                                              c10::Device const& d)
{
  std::vector<at::Tensor> out;
  out.reserve(ts.size());
  for (auto const& t : ts)
    out.emplace_back(restore_device(t, d));
  return out;
}

template <typename... Ts>
std::tuple<Ts...> restore_device(std::tuple<Ts...> const& ts,
                                 c10::Device const& d)
{
  return std::apply(
    [&d](auto const&... t) {
      return std::tuple<Ts...> {restore_device(t, d)...};
    },
    ts);
}

///@}

}  // namespace mpscompat
