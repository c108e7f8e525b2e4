////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include <mpscompat/emulator/allocator.hpp>
#include <mpscompat/emulator/copy.hpp>
#include <mpscompat/emulator/device_guard.hpp>
#include <mpscompat/emulator/empty_tensor.hpp>
#include <mpscompat/emulator/fallback.hpp>

#include <ATen/ATen.h>
#include <c10/core/Device.h>
#include <torch/library.h>

#include <optional>
#include <utility>

// Static registrations for the emulated backend. These run when the
// library is loaded; emulator::initialize() does the rest (backend
// name and hooks), which PyTorch does not allow from a static
// initializer.

namespace at::detail
{

// NB: The first macro arg will be appended to "c10::DeviceType::", so
// we cannot use "EmulatedDeviceT" here.
C10_REGISTER_GUARD_IMPL(PrivateUse1, mpscompat::emulator::DeviceGuardImpl);

}  // namespace at::detail

REGISTER_ALLOCATOR(mpscompat::emulator::EmulatedDeviceT,
                   &::mpscompat::emulator::get_allocator());

namespace
{

at::Tensor mpsemu_empty_memory_format(
  c10::IntArrayRef size,
  std::optional<at::ScalarType> dtype_opt,
  std::optional<at::Layout> layout_opt,
  std::optional<at::Device> device_opt,
  std::optional<bool> pin_memory_opt,
  std::optional<c10::MemoryFormat> memory_format_opt)
{
  return at::Tensor {
    mpscompat::emulator::empty_emulated(std::move(size),
                                        std::move(dtype_opt),
                                        std::move(layout_opt),
                                        std::move(device_opt),
                                        std::move(pin_memory_opt),
                                        std::move(memory_format_opt))};
}

at::Tensor mpsemu_empty_strided(c10::IntArrayRef size,
                                c10::IntArrayRef stride,
                                std::optional<at::ScalarType> dtype_opt,
                                std::optional<at::Layout> layout_opt,
                                std::optional<at::Device> device_opt,
                                std::optional<bool> pin_memory_opt)
{
  return at::Tensor {
    mpscompat::emulator::empty_strided_emulated(std::move(size),
                                                std::move(stride),
                                                std::move(dtype_opt),
                                                std::move(layout_opt),
                                                std::move(device_opt),
                                                std::move(pin_memory_opt))};
}

at::Tensor mpsemu__copy_from(at::Tensor const& self,
                             at::Tensor const& dst,
                             bool non_blocking)
{
  return mpscompat::emulator::copy_from(self, dst, non_blocking);
}

at::Tensor mpsemu__copy_from_and_resize(at::Tensor const& self,
                                        at::Tensor const& dst)
{
  return mpscompat::emulator::copy_from_and_resize(self, dst);
}

}  // namespace

TORCH_LIBRARY_IMPL(_, PrivateUse1, m)
{
  m.fallback(torch::CppFunction::makeFromBoxedFunction<
             &mpscompat::emulator::emulator_fallback>());
}

TORCH_LIBRARY_IMPL(aten, PrivateUse1, m)
{
  m.impl("empty.memory_format", TORCH_FN(mpsemu_empty_memory_format));
  m.impl("empty_strided", TORCH_FN(mpsemu_empty_strided));
  m.impl("_copy_from", TORCH_FN(mpsemu__copy_from));
  m.impl("_copy_from_and_resize", TORCH_FN(mpsemu__copy_from_and_resize));
}
