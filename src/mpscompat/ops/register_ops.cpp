////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include <mpscompat/ops/linalg.hpp>

#include <ATen/Tensor.h>
#include <c10/util/string_view.h>
#include <torch/library.h>

// The guard is registered as CompositeImplicitAutograd: autograd sees
// straight through to the native primitives and the device copies,
// so gradients flow to the caller's original tensors.

namespace
{

at::Tensor mpscompat_contract(c10::string_view equation,
                              at::TensorList operands)
{
  return mpscompat::contract(equation, operands);
}

at::Tensor mpscompat_matmul(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::matmul(a, b);
}

at::Tensor mpscompat_batched_matmul(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::batched_matmul(a, b);
}

at::Tensor mpscompat_mm(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::mm(a, b);
}

}  // namespace

TORCH_LIBRARY(mpscompat, m)
{
  m.def("contract(str equation, Tensor[] operands) -> Tensor");
  m.def("matmul(Tensor a, Tensor b) -> Tensor");
  m.def("batched_matmul(Tensor a, Tensor b) -> Tensor");
  m.def("mm(Tensor a, Tensor b) -> Tensor");
}

TORCH_LIBRARY_IMPL(mpscompat, CompositeImplicitAutograd, m)
{
  m.impl("contract", TORCH_FN(mpscompat_contract));
  m.impl("matmul", TORCH_FN(mpscompat_matmul));
  m.impl("batched_matmul", TORCH_FN(mpscompat_batched_matmul));
  m.impl("mm", TORCH_FN(mpscompat_mm));
}
