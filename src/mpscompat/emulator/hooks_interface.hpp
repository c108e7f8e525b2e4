////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_emulator_export.h>

#include <ATen/detail/PrivateUse1HooksInterface.h>

namespace mpscompat::emulator
{

using EmulatorHooksArgs = at::PrivateUse1HooksArgs;

struct MPSCOMPAT_EMULATOR_EXPORT EmulatorHooksInterface final
  : public at::PrivateUse1HooksInterface
{
  EmulatorHooksInterface(EmulatorHooksArgs) {}
  virtual ~EmulatorHooksInterface() = default;

  /** @name AcceleratorHooksInterface interface */
  ///@{

  bool hasPrimaryContext(c10::DeviceIndex) const final;

  c10::DeviceIndex deviceCount() const final;
  void setCurrentDevice(c10::DeviceIndex) const final;
  c10::DeviceIndex getCurrentDevice() const final;
  c10::DeviceIndex exchangeDevice(c10::DeviceIndex) const final;
  c10::DeviceIndex maybeExchangeDevice(c10::DeviceIndex) const final;

  bool isPinnedPtr(void const*) const final;
  c10::Allocator* getPinnedMemoryAllocator() const final;
  at::Device getDeviceFromPtr(void*) const final;

  ///@}
  /** @name Specific PrivateUse1HooksInterface interface */
  ///@{
  at::Generator const& getDefaultGenerator(c10::DeviceIndex) const final;
  void resizePrivateUse1Bytes(c10::Storage const&, size_t) const final;
  ///@}
};  // struct EmulatorHooksInterface

EmulatorHooksInterface* get_emulator_hooks();

}  // namespace mpscompat::emulator
