////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "linalg.hpp"

#include <mpscompat/ops/dispatch_guard.hpp>

#include <ATen/ops/bmm.h>
#include <ATen/ops/einsum.h>
#include <ATen/ops/matmul.h>
#include <ATen/ops/mm.h>

#include <array>

at::Tensor mpscompat::contract(c10::string_view equation,
                               at::TensorList operands,
                               DeviceCapabilities const& caps)
{
  return detail::guarded_call(
    "contract", caps, operands, [equation](at::TensorList ops) {
      return at::einsum(equation, ops);
    });
}

at::Tensor mpscompat::matmul(at::Tensor const& a,
                             at::Tensor const& b,
                             DeviceCapabilities const& caps)
{
  // Handles only (refcount bumps); no tensor data is allocated.
  std::array<at::Tensor, 2> const operands {a, b};
  return detail::guarded_call(
    "matmul", caps, operands, [](at::TensorList ops) {
      return at::matmul(ops[0], ops[1]);
    });
}

at::Tensor mpscompat::batched_matmul(at::Tensor const& a,
                                     at::Tensor const& b,
                                     DeviceCapabilities const& caps)
{
  std::array<at::Tensor, 2> const operands {a, b};
  return detail::guarded_call(
    "batched_matmul", caps, operands, [](at::TensorList ops) {
      return at::bmm(ops[0], ops[1]);
    });
}

at::Tensor mpscompat::mm(at::Tensor const& a,
                         at::Tensor const& b,
                         DeviceCapabilities const& caps)
{
  std::array<at::Tensor, 2> const operands {a, b};
  return detail::guarded_call("mm", caps, operands, [](at::TensorList ops) {
    return at::mm(ops[0], ops[1]);
  });
}

bool mpscompat::needs_fallback(at::TensorList operands,
                               DeviceCapabilities const& caps)
{
  auto const operative = find_restricted_device(caps, operands);
  return operative.has_value()
         && lacks_support(caps, *operative, element_kind(operands));
}
