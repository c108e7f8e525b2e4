////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "device_helpers.hpp"

#include <mpscompat/utils/logging.hpp>
#include <mpscompat/utils/tensor_helpers.hpp>

std::vector<at::Tensor>
mpscompat::relocate_to_fallback(DeviceCapabilities const& caps,
                                at::TensorList operands)
{
  auto const& fallback = caps.fallback_device();

  std::vector<at::Tensor> out;
  out.reserve(operands.size());
  for (auto const& t : operands)
  {
    if (t.defined() && is_restricted(caps, t.device()))
    {
      MPSCOMPAT_TRACE("  relocating {} to {}", to_str(t), fallback.str());
      out.emplace_back(t.to(fallback));
    }
    else
      out.emplace_back(t);
  }
  return out;
}
