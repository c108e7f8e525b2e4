////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <mpscompat_export.h>

#include <mpscompat/types.hpp>

#include <c10/core/Device.h>
#include <c10/core/DeviceType.h>

#include <string>

namespace mpscompat
{

/** @class DeviceCapabilities
 *  @brief Static capability metadata for one restricted accelerator.
 *
 *  Names the single device type that cannot run complex-valued
 *  linear algebra and the device that can run it in its place. The
 *  value is immutable; there is deliberately no way to toggle the
 *  restriction at runtime.
 */
class MPSCOMPAT_EXPORT DeviceCapabilities
{
public:
  /** @brief Construct capability metadata.
   *
   *  @throws std::invalid_argument if `fallback` is itself of the
   *          restricted type.
   */
  DeviceCapabilities(c10::DeviceType restricted, c10::Device fallback);

  c10::DeviceType restricted_type() const noexcept { return m_restricted; }
  c10::Device const& fallback_device() const noexcept { return m_fallback; }

  std::string str() const;

private:
  c10::DeviceType m_restricted;
  c10::Device m_fallback;
};  // class DeviceCapabilities

/** @brief MPS cannot do complex linear algebra; the CPU can. */
MPSCOMPAT_EXPORT DeviceCapabilities const& default_capabilities() noexcept;

/** @brief True if `d` is the restricted accelerator. */
inline bool is_restricted(DeviceCapabilities const& caps,
                          c10::Device const& d) noexcept
{
  return d.type() == caps.restricted_type();
}

/** @brief The capability predicate.
 *
 *  True iff `d` is the restricted accelerator and the operation is
 *  complex-valued. Real-valued work is always supported.
 */
inline bool lacks_support(DeviceCapabilities const& caps,
                          c10::Device const& d,
                          ElementKind kind) noexcept
{
  return kind == ElementKind::Complex && is_restricted(caps, d);
}

}  // namespace mpscompat
