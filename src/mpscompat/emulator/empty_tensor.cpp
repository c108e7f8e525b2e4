////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "empty_tensor.hpp"

#include <mpscompat/emulator/allocator.hpp>
#include <mpscompat/emulator/device_guard.hpp>
#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/errors.hpp>
#include <mpscompat/utils/logging.hpp>
#include <mpscompat/utils/tensor_helpers.hpp>

#include <ATen/EmptyTensor.h>
#include <c10/core/DefaultDtype.h>

#include <stdexcept>

namespace
{
c10::Device checked_device(std::optional<c10::Device> const& device_opt)
{
  auto const d = device_opt.value_or(mpscompat::emulator::device());
  MPSCOMPAT_ASSERT(mpscompat::emulator::is_emulated(d),
                   std::runtime_error,
                   "The emulator should only be constructing tensors on the "
                   "\"PrivateUse1\" backend");
  // "mpsemu" means "mpsemu:0".
  return mpscompat::emulator::device();
}

void check_layout(std::optional<c10::Layout> const& layout_opt)
{
  if (layout_opt.has_value())
    MPSCOMPAT_ASSERT(*layout_opt == c10::Layout::Strided,
                     std::runtime_error,
                     "The mpsemu backend only supports \"Strided\" layout");
}

}  // namespace

at::TensorBase mpscompat::emulator::empty_emulated(
  c10::IntArrayRef size,
  std::optional<c10::ScalarType> dtype_opt,
  std::optional<c10::Layout> layout_opt,
  std::optional<c10::Device> device_opt,
  std::optional<bool> /*pin_memory_opt*/,
  std::optional<c10::MemoryFormat> memory_format_opt)
{
  check_layout(layout_opt);

  auto const device = checked_device(device_opt);
  auto const dtype = dtype_opt.value_or(c10::get_default_dtype_as_scalartype());

  EmulatedDeviceGuard device_guard(device);

  MPSCOMPAT_TRACE("empty_emulated(size={}, dtype={})",
                  to_str(size),
                  c10::toString(dtype));

  return at::detail::empty_generic(
    size, &get_allocator(), emulated_keyset(), dtype, memory_format_opt);
}

at::TensorBase mpscompat::emulator::empty_strided_emulated(
  c10::IntArrayRef size,
  c10::IntArrayRef stride,
  std::optional<c10::ScalarType> dtype_opt,
  std::optional<c10::Layout> layout_opt,
  std::optional<c10::Device> device_opt,
  std::optional<bool> /*pin_memory_opt*/)
{
  check_layout(layout_opt);

  auto const device = checked_device(device_opt);
  auto const dtype = dtype_opt.value_or(c10::get_default_dtype_as_scalartype());

  EmulatedDeviceGuard device_guard(device);

  MPSCOMPAT_TRACE("empty_strided_emulated(size={}, stride={}, dtype={})",
                  to_str(size),
                  to_str(stride),
                  c10::toString(dtype));

  return at::detail::empty_strided_generic(
    size, stride, &get_allocator(), emulated_keyset(), dtype);
}
