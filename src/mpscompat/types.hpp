////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <ATen/Tensor.h>
#include <c10/core/ScalarType.h>
#include <c10/util/ArrayRef.h>

#include <ostream>

namespace mpscompat
{

/** @brief The only dtype distinction the guard cares about. */
enum class ElementKind
{
  Real,
  Complex
};

inline char const* to_str(ElementKind k) noexcept
{
  switch (k)
  {
  case ElementKind::Real: return "real";
  case ElementKind::Complex: return "complex";
  }
  return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, ElementKind k)
{
  return os << to_str(k);
}

/** @brief Classify a scalar type.
 *
 *  ComplexHalf, ComplexFloat and ComplexDouble are all complex.
 */
inline ElementKind element_kind(c10::ScalarType t) noexcept
{
  return c10::isComplexType(t) ? ElementKind::Complex : ElementKind::Real;
}

/** @brief Classify a set of operands.
 *
 *  The set is complex if any defined operand is complex. Undefined
 *  tensors are skipped.
 */
inline ElementKind element_kind(at::TensorList operands) noexcept
{
  for (auto const& t : operands)
    if (t.defined() && c10::isComplexType(t.scalar_type()))
      return ElementKind::Complex;
  return ElementKind::Real;
}

}  // namespace mpscompat
