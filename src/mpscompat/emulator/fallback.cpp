////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "fallback.hpp"

#include <mpscompat/emulator/copy.hpp>
#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/utils/errors.hpp>
#include <mpscompat/utils/logging.hpp>
#include <mpscompat/utils/tensor_helpers.hpp>

#include <ATen/core/ivalue.h>
#include <c10/util/Exception.h>
#include <c10/util/ScopeExit.h>
#include <c10/util/irange.h>

#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace
{

// Names only; the overload does not matter.
constexpr std::array<std::string_view, 14> complex_restricted_ops = {
  "aten::mm",
  "aten::bmm",
  "aten::addmm",
  "aten::addmm_",
  "aten::_addmm_activation",
  "aten::baddbmm",
  "aten::baddbmm_",
  "aten::addbmm",
  "aten::addbmm_",
  "aten::mv",
  "aten::addmv",
  "aten::addmv_",
  "aten::dot",
  "aten::vdot",
};

bool is_complex(at::Tensor const& t)
{
  return t.defined() && t.is_complex();
}

bool any_complex_arg(c10::ArrayRef<c10::IValue> args)
{
  for (auto const& arg : args)
  {
    if (arg.isTensor() && is_complex(arg.toTensor()))
      return true;
    if (arg.isTensorList())
      for (auto const& t : arg.toTensorVector())
        if (is_complex(t))
          return true;
    if (arg.isOptionalTensorList())
      for (auto const& t : arg.toOptionalTensorVector())
        if (t && is_complex(*t))
          return true;
  }
  return false;
}

template <typename T>
std::vector<T> alias_list_as_cpu(std::vector<T> const& tensor_list)
{
  std::vector<T> out;
  out.reserve(tensor_list.size());
  for (auto const& t : tensor_list)
  {
    if constexpr (std::is_same_v<T, at::Tensor>)
      out.emplace_back(mpscompat::emulator::alias_as_cpu(t));
    else
      out.emplace_back(t ? std::optional<at::Tensor> {
                             mpscompat::emulator::alias_as_cpu(*t)}
                         : std::nullopt);
  }
  return out;
}

bool same_alias_set(c10::AliasInfo const* a, c10::AliasInfo const* b)
{
  return a == b || (a && b && *a == *b);
}

}  // namespace

bool mpscompat::emulator::is_complex_restricted(std::string_view name) noexcept
{
  return std::find(complex_restricted_ops.cbegin(),
                   complex_restricted_ops.cend(),
                   name)
         != complex_restricted_ops.cend();
}

void mpscompat::emulator::emulator_fallback(c10::OperatorHandle const& op,
                                            c10::DispatchKeySet ks,
                                            torch::jit::Stack* stack)
{
  auto const& schema = op.schema();
  auto const& op_name = schema.operator_name().name;
  auto const& schema_args = schema.arguments();
  auto const num_args = schema_args.size();
  auto const args_beg = stack->size() - num_args;

  MPSCOMPAT_DEBUG("emulator_fallback(schema=\"{}\", keyset={})",
                  c10::toString(schema),
                  c10::toString(ks));

  auto args = torch::jit::last(*stack, num_args);

  TORCH_CHECK_NOT_IMPLEMENTED(
    !(is_complex_restricted(op_name) && any_complex_arg(args)),
    "The operator '",
    op_name,
    "' is not implemented for complex inputs on the ",
    backend_name,
    " device.");

  // Originals, kept so their storages can be restored afterwards.
  std::vector<at::Tensor> orig_tensors;
  std::vector<size_t> orig_tensor_idx;
  std::vector<std::vector<at::Tensor>> orig_tensor_lists;
  std::vector<std::vector<std::optional<at::Tensor>>> orig_opt_tensor_lists;

  for (auto const i : c10::irange(num_args))
  {
    if (args[i].isTensor())
    {
      auto const& t = orig_tensors.emplace_back(args[i].toTensor());
      orig_tensor_idx.push_back(i);
      MPSCOMPAT_TRACE("  arg \"{}\": tensor={}", schema_args[i].name(), to_str(t));
      (*stack)[args_beg + i] = c10::IValue(alias_as_cpu(t));
    }
    else if (args[i].isTensorList())
    {
      auto const& tl = orig_tensor_lists.emplace_back(args[i].toTensorVector());
      (*stack)[args_beg + i] = c10::IValue(alias_list_as_cpu(tl));
    }
    else if (args[i].isOptionalTensorList())
    {
      auto const& tl =
        orig_opt_tensor_lists.emplace_back(args[i].toOptionalTensorVector());
      (*stack)[args_beg + i] = c10::IValue(alias_list_as_cpu(tl));
    }
    else if (args[i].isDevice())
    {
      TORCH_CHECK_NOT_IMPLEMENTED(false,
                                  "The ",
                                  backend_name,
                                  " fallback does not handle Device "
                                  "arguments (operator '",
                                  op_name,
                                  "').");
    }
  }

  {
    // Restore the input storages to the emulated device, also when the
    // CPU kernel throws.
    auto const restore_inputs = c10::make_scope_exit([&]() {
      for (auto const& t : orig_tensors)
        sync_data_ptr_device(t);
      for (auto const& tl : orig_tensor_lists)
        for (auto const& t : tl)
          sync_data_ptr_device(t);
      for (auto const& tl : orig_opt_tensor_lists)
        for (auto const& t : tl)
          if (t)
            sync_data_ptr_device(*t);
    });
    op.redispatchBoxed(ks.remove_backend(EmulatedBit), stack);
  }

  auto const& schema_outs = schema.returns();
  auto const num_outs = schema_outs.size();
  auto const outs_begin = stack->size() - num_outs;
  auto outs = torch::jit::last(*stack, num_outs);
  for (auto const out_idx : c10::irange(num_outs))
  {
    auto const& out = outs[out_idx];
    c10::AliasInfo const* const alias_info = schema_outs[out_idx].alias_info();

    if (out.isTensor())
    {
      auto out_tensor = out.toTensor();
      if (!out_tensor.defined())
        continue;

      // In-place and out= ops return one of their inputs. Hand that
      // input back with whatever metadata the kernel gave the alias.
      if (alias_info && alias_info->isWrite())
      {
        bool found = false;
        for (auto const j : c10::irange(orig_tensor_idx.size()))
        {
          auto& in_tensor = orig_tensors[j];
          if (in_tensor.defined()
              && same_alias_set(schema_args[orig_tensor_idx[j]].alias_info(),
                                alias_info))
          {
            sync_metadata(out_tensor, in_tensor);
            (*stack)[outs_begin + out_idx] = c10::IValue(in_tensor);
            found = true;
            break;
          }
        }
        MPSCOMPAT_ASSERT(found,
                         std::runtime_error,
                         "Alias mismatch in emulator fallback for "
                           + std::string {op_name});
      }
      else
        (*stack)[outs_begin + out_idx] =
          c10::IValue(alias_as_emulated(out_tensor));
    }
    else if (out.isTensorList())
    {
      auto tl = out.toTensorVector();
      for (auto& t : tl)
        t = alias_as_emulated(t);
      (*stack)[outs_begin + out_idx] = c10::IValue(std::move(tl));
    }
  }

  MPSCOMPAT_DEBUG("END emulator_fallback(op={})", op_name);
}
