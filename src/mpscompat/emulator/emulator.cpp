////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "emulator.hpp"

#include <mpscompat/emulator/detail/transfer_probe.hpp>
#include <mpscompat/emulator/hooks_interface.hpp>
#include <mpscompat/utils/logging.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>

#include <ATen/detail/PrivateUse1HooksInterface.h>
#include <c10/core/DeviceType.h>

namespace
{
std::atomic<std::uint64_t> _transfer_count {0};
std::atomic<bool> _initialized {false};
std::once_flag _init_flag;

void do_initialize()
{
  if (c10::is_privateuse1_backend_registered())
  {
    auto const name = c10::get_privateuse1_backend();
    if (name != mpscompat::emulator::backend_name)
      throw std::runtime_error("Cannot register the mpsemu backend with "
                               "PyTorch. PrivateUse1 backend is already "
                               "registered as \""
                               + name + "\"!");
  }
  else
    c10::register_privateuse1_backend(mpscompat::emulator::backend_name);

  at::RegisterPrivateUse1HooksInterface(
    mpscompat::emulator::get_emulator_hooks());

  MPSCOMPAT_DEBUG("Registered emulated restricted device \"{}\"",
                  mpscompat::emulator::device().str());
  _initialized = true;
}

}  // namespace

void mpscompat::emulator::initialize()
{
  std::call_once(_init_flag, do_initialize);
}

bool mpscompat::emulator::is_initialized() noexcept
{
  return _initialized.load();
}

mpscompat::DeviceCapabilities const&
mpscompat::emulator::capabilities() noexcept
{
  static DeviceCapabilities const caps {EmulatedDeviceT,
                                        c10::Device {c10::DeviceType::CPU}};
  return caps;
}

std::uint64_t mpscompat::emulator::transfer_count() noexcept
{
  return _transfer_count.load();
}

void mpscompat::emulator::reset_transfer_count() noexcept
{
  _transfer_count = 0;
}

void mpscompat::emulator::detail::record_transfer(c10::Device const& from,
                                                  c10::Device const& to)
{
  if (from == to)
    return;
  auto const n = ++_transfer_count;
  MPSCOMPAT_TRACE("transfer #{}: {} -> {}", n, from.str(), to.str());
}
