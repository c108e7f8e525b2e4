////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include <mpscompat_config.h>

#include <mpscompat/backend/capabilities.hpp>
#include <mpscompat/ops/linalg.hpp>
#include <mpscompat/utils/logging.hpp>

#if MPSCOMPAT_WITH_EMULATOR
#include <mpscompat/emulator/emulator.hpp>
#endif

#include <string>
#include <vector>

#include <ATen/Tensor.h>
#include <pybind11/pybind11.h>
#include <torch/csrc/utils/pybind.h>

namespace py = pybind11;

namespace
{

std::vector<at::Tensor> tensors_from_args(py::args const& args)
{
  std::vector<at::Tensor> out;
  out.reserve(args.size());
  for (auto const& h : args)
    out.emplace_back(h.cast<at::Tensor>());
  return out;
}

at::Tensor py_contract(std::string const& equation, py::args const& operands)
{
  return mpscompat::contract(equation, tensors_from_args(operands));
}

bool py_needs_fallback(py::args const& tensors)
{
  return mpscompat::needs_fallback(tensors_from_args(tensors));
}

#if MPSCOMPAT_WITH_EMULATOR

at::Tensor py_emulated_contract(std::string const& equation,
                                py::args const& operands)
{
  return mpscompat::contract(equation,
                             tensors_from_args(operands),
                             mpscompat::emulator::capabilities());
}

at::Tensor py_emulated_matmul(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::matmul(a, b, mpscompat::emulator::capabilities());
}

at::Tensor py_emulated_batched_matmul(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::batched_matmul(a, b, mpscompat::emulator::capabilities());
}

at::Tensor py_emulated_mm(at::Tensor const& a, at::Tensor const& b)
{
  return mpscompat::mm(a, b, mpscompat::emulator::capabilities());
}

std::string py_emulator_device()
{
  return mpscompat::emulator::device().str();
}

void add_emulator_funcs(py::module_& m)
{
  m.def("init_emulator",
        &mpscompat::emulator::initialize,
        "Register the emulated restricted device (\"mpsemu\") with PyTorch");
  m.def("is_emulator_initialized",
        &mpscompat::emulator::is_initialized,
        "Query initialization state of the emulated device");
  m.def("emulator_device",
        &py_emulator_device,
        "Device string of the emulated restricted device");
  m.def("transfer_count",
        &mpscompat::emulator::transfer_count,
        "Copies between the emulated device and other devices");
  m.def("reset_transfer_count",
        &mpscompat::emulator::reset_transfer_count,
        "Reset the transfer counter");

  m.def("emulated_contract",
        &py_emulated_contract,
        "contract() treating the emulated device as restricted");
  m.def("emulated_matmul",
        &py_emulated_matmul,
        "matmul() treating the emulated device as restricted");
  m.def("emulated_batched_matmul",
        &py_emulated_batched_matmul,
        "batched_matmul() treating the emulated device as restricted");
  m.def("emulated_mm",
        &py_emulated_mm,
        "mm() treating the emulated device as restricted");
}

#endif  // MPSCOMPAT_WITH_EMULATOR

}  // namespace

PYBIND11_MODULE(_mpscompat, m)
{
  m.attr("__version__") = MPSCOMPAT_VERSION;
  m.attr("has_mps_backend") = static_cast<bool>(MPSCOMPAT_HAS_MPS_BACKEND);

  // Default capabilities (MPS restricted, CPU fallback).
  m.def("contract",
        &py_contract,
        "Einstein summation that falls back to CPU for complex operands on "
        "MPS");
  m.def("matmul",
        [](at::Tensor const& a, at::Tensor const& b) {
          return mpscompat::matmul(a, b);
        },
        "Matrix product that falls back to CPU for complex operands on MPS");
  m.def("batched_matmul",
        [](at::Tensor const& a, at::Tensor const& b) {
          return mpscompat::batched_matmul(a, b);
        },
        "Batched matrix product that falls back to CPU for complex operands "
        "on MPS");
  m.def("mm",
        [](at::Tensor const& a, at::Tensor const& b) {
          return mpscompat::mm(a, b);
        },
        "2D matrix product that falls back to CPU for complex operands on "
        "MPS");
  m.def("needs_fallback",
        &py_needs_fallback,
        "Whether a call over these tensors would run on the fallback device");

#if MPSCOMPAT_WITH_EMULATOR
  add_emulator_funcs(m);
#endif
}
