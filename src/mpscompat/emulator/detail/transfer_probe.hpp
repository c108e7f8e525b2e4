////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <c10/core/Device.h>

namespace mpscompat::emulator::detail
{

/** @brief Count one copy from @p from to @p to, unless they are the
 *         same device.
 */
void record_transfer(c10::Device const& from, c10::Device const& to);

}  // namespace mpscompat::emulator::detail
