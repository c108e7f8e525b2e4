////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "copy.hpp"

#include <mpscompat/emulator/detail/transfer_probe.hpp>
#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/logging.hpp>
#include <mpscompat/utils/tensor_helpers.hpp>

#include <c10/core/DeviceType.h>
#include <c10/util/ScopeExit.h>

at::Tensor mpscompat::emulator::alias_as_cpu(at::Tensor const& t)
{
  if (!is_emulated(t))
    return t;
  return alias_as_device(t,
                         c10::Device {c10::DeviceType::CPU},
                         t.key_set().remove_backend(EmulatedBit));
}

at::Tensor mpscompat::emulator::alias_as_emulated(at::Tensor const& t)
{
  if (!t.defined() || is_emulated(t))
    return t;
  return alias_as_device(t, device(), emulated_keyset());
}

at::Tensor mpscompat::emulator::copy_from(at::Tensor const& self,
                                          at::Tensor const& dst,
                                          bool non_blocking)
{
  MPSCOMPAT_TRACE("copy_from(self={}, dst={}, nonblocking={})",
                  to_str(self),
                  to_str(dst),
                  non_blocking);

  // Both sides are host memory; copy through CPU aliases with ATen's
  // own CPU copy kernels.
  {
    at::Tensor dst_alias = alias_as_cpu(dst);
    at::Tensor const src_alias = alias_as_cpu(self);
    auto const restore = c10::make_scope_exit([&]() {
      sync_data_ptr_device(dst);
      sync_data_ptr_device(self);
    });

    dst_alias.copy_(src_alias, non_blocking);
  }

  detail::record_transfer(self.device(), dst.device());
  return dst;
}

at::Tensor mpscompat::emulator::copy_from_and_resize(at::Tensor const& self,
                                                     at::Tensor const& dst)
{
  MPSCOMPAT_TRACE(
    "copy_from_and_resize(self={}, dst={})", to_str(self), to_str(dst));

  {
    at::Tensor dst_alias = alias_as_cpu(dst);
    auto const restore = c10::make_scope_exit([&]() {
      sync_data_ptr_device(dst);
      sync_data_ptr_device(self);
    });

    dst_alias.resize_(self.sizes());
    dst_alias.copy_(alias_as_cpu(self));
    sync_metadata(dst_alias, const_cast<at::Tensor&>(dst));
  }

  detail::record_transfer(self.device(), dst.device());
  return dst;
}
