////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "hooks_interface.hpp"

#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/errors.hpp>

#include <mutex>
#include <stdexcept>

#include <ATen/native/Resize.h>
#include <c10/core/CPUAllocator.h>

#define MPSCOMPAT_NOT_IMPLEMENTED(fn)                                          \
  throw std::runtime_error("Not implemented: " fn)

namespace mpscompat::emulator
{
bool EmulatorHooksInterface::hasPrimaryContext(
  [[maybe_unused]] c10::DeviceIndex const device_index) const
{
  MPSCOMPAT_ASSERT_DEBUG(device_index == 0);
  return true;
}

c10::DeviceIndex EmulatorHooksInterface::deviceCount() const
{
  return NumEmulatedDevices;
}

void EmulatorHooksInterface::setCurrentDevice(
  [[maybe_unused]] c10::DeviceIndex const device_index) const
{
  MPSCOMPAT_ASSERT_ALWAYS(device_index == 0);
}

c10::DeviceIndex EmulatorHooksInterface::getCurrentDevice() const
{
  return 0;
}

c10::DeviceIndex
EmulatorHooksInterface::exchangeDevice(c10::DeviceIndex const device_index) const
{
  MPSCOMPAT_ASSERT_ALWAYS(device_index == 0);
  return 0;
}

c10::DeviceIndex EmulatorHooksInterface::maybeExchangeDevice(
  c10::DeviceIndex const device_index) const
{
  return exchangeDevice(device_index);
}

bool EmulatorHooksInterface::isPinnedPtr(void const* const /*ptr*/) const
{
  return false;
}

c10::Allocator* EmulatorHooksInterface::getPinnedMemoryAllocator() const
{
  // There is no separate device memory to pin against.
  return c10::GetCPUAllocator();
}

at::Device EmulatorHooksInterface::getDeviceFromPtr(void* const) const
{
  return device();
}

at::Generator const&
EmulatorHooksInterface::getDefaultGenerator(c10::DeviceIndex const) const
{
  MPSCOMPAT_NOT_IMPLEMENTED("EmulatorHooksInterface::getDefaultGenerator");
}

void EmulatorHooksInterface::resizePrivateUse1Bytes(
  c10::Storage const& storage, size_t const new_bytes) const
{
  // Emulated storage is host memory from our allocator, so the CPU
  // resize is correct; it reallocates through storage.allocator().
  at::native::resize_bytes_cpu(storage.unsafeGetStorageImpl(), new_bytes);
}

}  // namespace mpscompat::emulator

mpscompat::emulator::EmulatorHooksInterface*
mpscompat::emulator::get_emulator_hooks()
{
  // Stateless; intentionally never freed, like PyTorch's own backends.
  static EmulatorHooksInterface* hooks = nullptr;
  static std::once_flag flag;
  std::call_once(flag, []() {
    hooks = new EmulatorHooksInterface(EmulatorHooksArgs {});
  });
  return hooks;
}
