////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include "mpscompat/utils/errors.hpp"

#include <ATen/NamedTensorUtils.h>
#include <ATen/Tensor.h>
#include <c10/util/ArrayRef.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace mpscompat
{

/** @brief Minimal tensor stringification.
 *
 *  Returns "[ {device type}{data type}[d1, d2, ..., dn] ]", for
 *  example, "[ CPUComplexFloatType[2, 2] ]", or "[ undefined ]".
 */
inline std::string to_str(at::Tensor const& t)
{
  if (!t.defined())
    return "[ undefined ]";
  std::ostringstream oss;
  oss << "[ " << t.toString() << t.sizes() << " ]";
  return oss.str();
}

/** @brief ArrayRef stringification */
template <typename T>
std::string to_str(c10::ArrayRef<T> const& ar)
{
  std::ostringstream oss;
  oss << ar;
  return oss.str();
}

/** @brief Operand list stringification, one to_str() per tensor. */
inline std::string to_str(at::TensorList const& tl)
{
  std::ostringstream oss;
  oss << "{";
  for (size_t i = 0; i < tl.size(); ++i)
    oss << (i ? ", " : " ") << to_str(tl[i]);
  oss << " }";
  return oss.str();
}

inline void set_data_ptr_device(c10::Storage const& s, c10::Device d)
{
  s.mutable_data_ptr().unsafe_set_device(std::move(d));
}

inline void sync_metadata(at::Tensor const& src, at::Tensor& dst)
{
  auto* dst_tensor_info = dst.unsafeGetTensorImpl();
  dst_tensor_info->set_storage_offset(src.storage_offset());
  dst_tensor_info->set_sizes_and_strides(src.sizes(), src.strides());
  at::namedinference::propagate_names(dst, src);
}

/** @brief Make an alias of the tensor on a new backend.
 *
 *  The alias shares storage with `orig_tensor` but reports device `d`
 *  and dispatches with `ks`.
 *
 *  @post The original tensor keeps its device type and keys, but
 *        its DataPtr will appear to be on `d` if queried. Call
 *        sync_data_ptr_device() on it to undo that.
 */
inline at::Tensor alias_as_device(at::Tensor const& orig_tensor,
                                  c10::Device const& d,
                                  c10::DispatchKeySet ks)
{
  at::Storage aliased_storage(orig_tensor.storage());
  set_data_ptr_device(aliased_storage, d);

  auto alias_tensor =
    at::detail::make_tensor<at::TensorImpl>(c10::TensorImpl::VIEW,
                                            std::move(aliased_storage),
                                            std::move(ks),
                                            orig_tensor.dtype());
  sync_metadata(orig_tensor, alias_tensor);

  MPSCOMPAT_ASSERT(alias_tensor.const_data_ptr() == orig_tensor.const_data_ptr(),
                   std::runtime_error,
                   "Aliasing tensor data has failed");

  return alias_tensor;
}

/** @brief Set the underlying DataPtr to the same device as the tensor.
 *
 *  @post `t.storage().data_ptr().device() == t.device()`
 */
inline void sync_data_ptr_device(at::Tensor const& t)
{
  if (t.defined())
    set_data_ptr_device(t.storage(), t.device());
}

}  // namespace mpscompat
