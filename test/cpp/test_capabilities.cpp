////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include <mpscompat/backend/capabilities.hpp>
#include <mpscompat/types.hpp>
#include <mpscompat/utils/device_helpers.hpp>

#include <ATen/ATen.h>

// A c10 header file in PyTorch has left a macro called `CHECK`
// defined. To prevent warnings, we need to clear that out. This
// should not cause problems as we don't use the PyTorch macro
// directly, and all PyTorch includes should precede this line in this
// source code.
#ifdef CHECK
#undef CHECK
#endif

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <stdexcept>

using namespace mpscompat;

TEST_CASE("element_kind of scalar types", "[types]")
{
  SECTION("Complex types")
  {
    auto const t = GENERATE(c10::ScalarType::ComplexHalf,
                            c10::ScalarType::ComplexFloat,
                            c10::ScalarType::ComplexDouble);
    CHECK(element_kind(t) == ElementKind::Complex);
  }

  SECTION("Real types")
  {
    auto const t = GENERATE(c10::ScalarType::Bool,
                            c10::ScalarType::Int,
                            c10::ScalarType::Long,
                            c10::ScalarType::Half,
                            c10::ScalarType::BFloat16,
                            c10::ScalarType::Float,
                            c10::ScalarType::Double);
    CHECK(element_kind(t) == ElementKind::Real);
  }
}

TEST_CASE("element_kind of operand lists", "[types]")
{
  auto const real = at::ones({2, 2}, at::kFloat);
  auto const cplx = at::ones({2, 2}, at::kComplexDouble);

  CHECK(element_kind(at::TensorList {}) == ElementKind::Real);
  CHECK(element_kind({real, real}) == ElementKind::Real);
  CHECK(element_kind({real, cplx}) == ElementKind::Complex);
  CHECK(element_kind({cplx}) == ElementKind::Complex);

  // Undefined tensors have no dtype to look at.
  CHECK(element_kind({at::Tensor {}, real}) == ElementKind::Real);
  CHECK(element_kind({at::Tensor {}, cplx}) == ElementKind::Complex);
}

TEST_CASE("Default capabilities", "[capabilities]")
{
  auto const& caps = default_capabilities();
  CHECK(caps.restricted_type() == c10::DeviceType::MPS);
  CHECK(caps.fallback_device() == c10::Device {c10::kCPU});
  CHECK(&caps == &default_capabilities());
  CHECK_THAT(caps.str(), Catch::Matchers::ContainsSubstring("mps"));
}

TEST_CASE("lacks_support", "[capabilities]")
{
  auto const& caps = default_capabilities();
  c10::Device const mps {c10::DeviceType::MPS, 0};
  c10::Device const cpu {c10::DeviceType::CPU};
  c10::Device const cuda {c10::DeviceType::CUDA, 0};
  c10::Device const pu1 {c10::DeviceType::PrivateUse1, 0};

  CHECK(is_restricted(caps, mps));
  CHECK(is_restricted(caps, c10::Device {c10::DeviceType::MPS}));
  CHECK_FALSE(is_restricted(caps, cpu));

  CHECK(lacks_support(caps, mps, ElementKind::Complex));
  CHECK_FALSE(lacks_support(caps, mps, ElementKind::Real));

  // Only the one named device is restricted.
  for (auto const& d : {cpu, cuda, pu1})
  {
    CHECK_FALSE(lacks_support(caps, d, ElementKind::Complex));
    CHECK_FALSE(lacks_support(caps, d, ElementKind::Real));
  }
}

TEST_CASE("Custom capabilities", "[capabilities]")
{
  DeviceCapabilities const caps {c10::DeviceType::CUDA, c10::Device {c10::kCPU}};
  CHECK(lacks_support(caps, {c10::DeviceType::CUDA, 1}, ElementKind::Complex));
  CHECK_FALSE(
    lacks_support(caps, {c10::DeviceType::MPS, 0}, ElementKind::Complex));

  REQUIRE_THROWS_AS(
    DeviceCapabilities(c10::DeviceType::CPU, c10::Device {c10::kCPU}),
    std::invalid_argument);
  REQUIRE_THROWS_WITH(
    DeviceCapabilities(c10::DeviceType::MPS, c10::Device {c10::kMPS}),
    Catch::Matchers::StartsWith("Fallback device must not be"));
}

TEST_CASE("find_restricted_device", "[capabilities][utils]")
{
  auto const& caps = default_capabilities();
  auto const a = at::ones({2}, at::kComplexFloat);
  auto const b = at::ones({2}, at::kFloat);

  // No MPS tensors on this host; nothing is restricted.
  CHECK_FALSE(find_restricted_device(caps, {a, b}).has_value());
  CHECK_FALSE(find_restricted_device(caps, {}).has_value());
  CHECK_FALSE(find_restricted_device(caps, {at::Tensor {}}).has_value());

  // CPU is restricted here, so both are.
  DeviceCapabilities const cpu_restricted {c10::DeviceType::CPU,
                                           c10::Device {c10::kMeta}};
  auto const d = find_restricted_device(cpu_restricted, {at::Tensor {}, a, b});
  REQUIRE(d.has_value());
  CHECK(*d == c10::Device {c10::kCPU});
}
