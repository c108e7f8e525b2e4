////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "capabilities.hpp"

#include <mpscompat/utils/errors.hpp>

#include <stdexcept>
#include <utility>

mpscompat::DeviceCapabilities::DeviceCapabilities(c10::DeviceType restricted,
                                                  c10::Device fallback)
  : m_restricted {restricted}, m_fallback {std::move(fallback)}
{
  MPSCOMPAT_ASSERT(m_fallback.type() != m_restricted,
                   std::invalid_argument,
                   "Fallback device must not be of the restricted device "
                   "type: "
                     + str());
}

std::string mpscompat::DeviceCapabilities::str() const
{
  return "DeviceCapabilities(restricted="
         + c10::DeviceTypeName(m_restricted, /*lower_case=*/true)
         + ", fallback=" + m_fallback.str() + ")";
}

mpscompat::DeviceCapabilities const&
mpscompat::default_capabilities() noexcept
{
  static DeviceCapabilities const caps {c10::DeviceType::MPS,
                                        c10::Device {c10::DeviceType::CPU}};
  return caps;
}
