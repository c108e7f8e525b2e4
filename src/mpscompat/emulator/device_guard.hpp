////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/errors.hpp>

#include <stdexcept>
#include <utility>

#include <c10/core/impl/DeviceGuardImplInterface.h>
#include <c10/core/impl/InlineDeviceGuard.h>

namespace mpscompat::emulator
{

/** @class DeviceGuardImpl
 *  @brief DeviceGuardImplInterface impl for the emulated device
 *
 *  There is exactly one emulated device, index 0, with a single
 *  (default) stream and no events. Switching devices is a no-op.
 */
class DeviceGuardImpl final : public c10::impl::DeviceGuardImplInterface
{
public:
  DeviceGuardImpl() = default;
  DeviceGuardImpl(c10::Device d) { setDevice(std::move(d)); }

  c10::DeviceType type() const final { return EmulatedDeviceT; }

  c10::Device exchangeDevice(c10::Device d) const final
  {
    c10::Device const old = getDevice();
    setDevice(std::move(d));
    return old;
  }

  c10::Device getDevice() const final { return device(); }

  void setDevice(c10::Device d) const final
  {
    MPSCOMPAT_ASSERT(is_emulated(d),
                     std::runtime_error,
                     "Device should be the emulated device (PrivateUse1).");
    MPSCOMPAT_ASSERT(d.index() < NumEmulatedDevices,
                     std::runtime_error,
                     "Invalid device index. Only \"mpsemu:0\" exists.");
  }

  void uncheckedSetDevice(c10::Device) const noexcept final {}

  c10::Stream getStream(c10::Device d) const noexcept final
  {
    return c10::Stream(c10::Stream::DEFAULT, d);
  }

  c10::Stream getNewStream(c10::Device, int /*priority*/ = 0) const final
  {
    return c10::Stream(c10::Stream::DEFAULT, getDevice());
  }

  c10::Stream exchangeStream(c10::Stream) const noexcept final
  {
    return c10::Stream(c10::Stream::DEFAULT, device());
  }

  c10::DeviceIndex deviceCount() const noexcept final
  {
    return NumEmulatedDevices;
  }

  void record(void**,
              c10::Stream const&,
              c10::DeviceIndex const,
              c10::EventFlag const) const final
  {
    throw std::runtime_error("mpsemu backend doesn't support events");
  }

  void block(void*, c10::Stream const&) const final
  {
    throw std::runtime_error("mpsemu backend doesn't support events");
  }

  bool queryEvent(void*) const final
  {
    throw std::runtime_error("mpsemu backend doesn't support events");
  }

  void destroyEvent(void*, c10::DeviceIndex const) const noexcept final {}

  // Everything runs synchronously on the host.
  bool queryStream(c10::Stream const&) const final { return true; }

  void synchronizeStream(c10::Stream const&) const final {}
};  // class DeviceGuardImpl

using EmulatedDeviceGuard = c10::impl::InlineDeviceGuard<DeviceGuardImpl>;

}  // namespace mpscompat::emulator
