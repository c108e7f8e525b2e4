////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ATen/core/dispatch/Dispatcher.h>
#include <ATen/core/stack.h>
#include <c10/core/DispatchKeySet.h>

#include <string_view>

namespace mpscompat::emulator
{

/** @brief Is this one of the operators the emulated device cannot
 *         run on complex inputs?
 *
 *  `name` is a qualified operator name without overload, e.g.
 *  "aten::mm". The set covers the matrix-product family: mm, bmm,
 *  addmm, baddbmm, addbmm, mv, addmv, dot, vdot (and their in-place
 *  and out variants, which share the name).
 */
bool is_complex_restricted(std::string_view name) noexcept;

/** @brief The default dispatch fallback for the emulated backend
 *
 *  Every emulated tensor argument (including those inside tensor
 *  lists) is aliased to the CPU and the operator is redispatched to
 *  its CPU kernel. Afterwards, input storages are restored to the
 *  emulated device; writeable-alias returns hand back the original
 *  input tensor, and every other tensor return is re-tagged as
 *  emulated (the memory is host memory either way).
 *
 *  Operators for which is_complex_restricted() holds are refused with
 *  c10::NotImplementedError when any tensor argument is complex,
 *  mirroring the gap in MPS's operator coverage.
 */
void emulator_fallback(c10::OperatorHandle const& op,
                       c10::DispatchKeySet ks,
                       torch::jit::Stack* stack);

}  // namespace mpscompat::emulator
