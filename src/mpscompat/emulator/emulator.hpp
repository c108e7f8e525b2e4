////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_emulator_export.h>

#include <mpscompat/backend/capabilities.hpp>

#include <ATen/Tensor.h>
#include <c10/core/Device.h>
#include <c10/core/DispatchKey.h>
#include <c10/core/DispatchKeySet.h>

#include <cstdint>

/** @file
 *
 *  An emulated restricted accelerator, registered with PyTorch as the
 *  "PrivateUse1" backend under the name "mpsemu".
 *
 *  Emulated tensors live in host memory. Their dispatch keysets carry
 *  both the PrivateUse1 and the CPU backend bits, so the boxed
 *  fallback can redispatch any operator to its CPU kernel after
 *  aliasing the arguments to the CPU. The exception is the
 *  matrix-product family (mm, bmm, addmm, mv, dot, ...), which
 *  refuses complex arguments the way MPS does.
 *
 *  Copies between the emulated device and any other device are
 *  counted; see transfer_count().
 */

namespace mpscompat::emulator
{

inline constexpr c10::DeviceType EmulatedDeviceT = c10::DeviceType::PrivateUse1;
inline constexpr c10::DispatchKey EmulatedDispKey = c10::DispatchKey::PrivateUse1;
inline constexpr c10::BackendComponent EmulatedBit =
  c10::BackendComponent::PrivateUse1Bit;
inline constexpr c10::DeviceIndex NumEmulatedDevices = 1;

inline constexpr char const* backend_name = "mpsemu";

/** @brief Register the emulated backend with PyTorch.
 *
 *  Safe to call any number of times from any thread.
 *
 *  @throws std::runtime_error if a different PrivateUse1 backend has
 *          already been registered in this process.
 */
MPSCOMPAT_EMULATOR_EXPORT void initialize();

MPSCOMPAT_EMULATOR_EXPORT bool is_initialized() noexcept;

/** @brief The (only) emulated device, "mpsemu:0". */
inline c10::Device device() noexcept
{
  return c10::Device {EmulatedDeviceT, 0};
}

inline bool is_emulated(c10::Device const& d) noexcept
{
  return d.type() == EmulatedDeviceT;
}

inline bool is_emulated(at::Tensor const& t)
{
  return t.defined() && t.is_privateuseone();
}

/** @brief Dispatch keys for an emulated tensor. */
inline c10::DispatchKeySet emulated_keyset() noexcept
{
  return c10::DispatchKeySet {EmulatedDispKey, c10::DispatchKey::CPU};
}

/** @brief Emulated device restricted, CPU as fallback. */
MPSCOMPAT_EMULATOR_EXPORT DeviceCapabilities const& capabilities() noexcept;

/** @name Transfer probe */
///@{

/** @brief Number of copies between the emulated device and another
 *         device since the last reset.
 */
MPSCOMPAT_EMULATOR_EXPORT std::uint64_t transfer_count() noexcept;

MPSCOMPAT_EMULATOR_EXPORT void reset_transfer_count() noexcept;

///@}

}  // namespace mpscompat::emulator
