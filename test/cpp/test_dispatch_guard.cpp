////////////////////////////////////////////////////////////////////////////////
// Copyright 2014-2025 Lawrence Livermore National Security, LLC and other
// LBANN Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////
#include "test_helpers.hpp"

#include <mpscompat/emulator/emulator.hpp>
#include <mpscompat/ops/linalg.hpp>
#include <mpscompat/utils/device_helpers.hpp>

#include <ATen/ATen.h>
#include <c10/util/Exception.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <tuple>
#include <vector>

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

using namespace mpscompat;
using mpscompat::testing::on_emulator;
using mpscompat::testing::on_host;
using mpscompat::testing::outcome_of;

namespace
{

constexpr double rtol = 1e-6;
constexpr double atol = 1e-6;

bool close(at::Tensor const& a, at::Tensor const& b)
{
  return at::allclose(a, b, rtol, atol);
}

}  // namespace

TEST_CASE("mm on the restricted device with complex operands",
          "[guard][fallback][mm]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  auto const a_host = at::randn({4, 3}, at::kComplexFloat);
  auto const b_host = at::randn({3, 5}, at::kComplexFloat);
  auto const a = on_emulator(a_host);
  auto const b = on_emulator(b_host);
  REQUIRE(needs_fallback({a, b}, caps));

  emulator::reset_transfer_count();
  auto const out = mm(a, b, caps);

  // Two operands out, one result back.
  CHECK(emulator::transfer_count() == 3);
  CHECK(out.device() == emulator::device());
  CHECK(out.scalar_type() == at::kComplexFloat);
  CHECK(out.sizes() == c10::IntArrayRef {4, 5});
  CHECK(close(on_host(out), at::mm(a_host, b_host)));

  // The inputs are untouched.
  CHECK(a.device() == emulator::device());
  CHECK(b.device() == emulator::device());
}

TEST_CASE("Every entry point falls back for complex operands",
          "[guard][fallback]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  SECTION("contract")
  {
    auto const x = at::randn({3, 4}, at::kComplexDouble);
    auto const y = at::randn({4, 2}, at::kComplexDouble);
    auto const out = contract("ij,jk->ik", {on_emulator(x), on_emulator(y)}, caps);
    CHECK(out.device() == emulator::device());
    CHECK(out.scalar_type() == at::kComplexDouble);
    CHECK(close(on_host(out), at::einsum("ij,jk->ik", {x, y})));
  }

  SECTION("contract with three operands")
  {
    auto const x = at::randn({2, 3}, at::kComplexFloat);
    auto const k = at::randn({3, 3}, at::kComplexFloat);
    auto const y = at::randn({2, 3}, at::kComplexFloat);
    auto const out = contract(
      "bi,ij,bj->b", {on_emulator(x), on_emulator(k), on_emulator(y)}, caps);
    CHECK(out.device() == emulator::device());
    CHECK(out.sizes() == c10::IntArrayRef {2});
    CHECK(close(on_host(out), at::einsum("bi,ij,bj->b", {x, k, y})));
  }

  SECTION("matmul with broadcasting")
  {
    auto const x = at::randn({2, 4, 3}, at::kComplexFloat);
    auto const y = at::randn({3, 5}, at::kComplexFloat);
    auto const out = matmul(on_emulator(x), on_emulator(y), caps);
    CHECK(out.device() == emulator::device());
    CHECK(out.sizes() == c10::IntArrayRef {2, 4, 5});
    CHECK(close(on_host(out), at::matmul(x, y)));
  }

  SECTION("batched_matmul")
  {
    auto const x = at::randn({3, 4, 2}, at::kComplexFloat);
    auto const y = at::randn({3, 2, 4}, at::kComplexFloat);
    auto const out = batched_matmul(on_emulator(x), on_emulator(y), caps);
    CHECK(out.device() == emulator::device());
    CHECK(out.sizes() == c10::IntArrayRef {3, 4, 4});
    CHECK(close(on_host(out), at::bmm(x, y)));
  }

  SECTION("mm")
  {
    auto const x = at::randn({2, 2}, at::kComplexDouble);
    auto const y = at::randn({2, 2}, at::kComplexDouble);
    auto const out = mm(on_emulator(x), on_emulator(y), caps);
    CHECK(out.device() == emulator::device());
    CHECK(close(on_host(out), at::mm(x, y)));
  }
}

TEST_CASE("Mixed-device complex operands", "[guard][fallback]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  SECTION("Only the restricted-device operand moves")
  {
    auto const x = at::randn({3, 3}, at::kComplexFloat);
    auto const y = at::randn({3, 3}, at::kComplexFloat);
    auto const x_emu = on_emulator(x);

    emulator::reset_transfer_count();
    auto const out = mm(x_emu, y, caps);
    CHECK(emulator::transfer_count() == 2);
    CHECK(out.device() == emulator::device());
    CHECK(close(on_host(out), at::mm(x, y)));
  }

  SECTION("The restricted device need not come first")
  {
    auto const x = at::randn({3, 3}, at::kComplexFloat);
    auto const y = at::randn({3, 3}, at::kComplexFloat);
    auto const out = matmul(x, on_emulator(y), caps);
    CHECK(out.device() == emulator::device());
    CHECK(close(on_host(out), at::matmul(x, y)));
  }

  SECTION("A complex host operand makes the call complex")
  {
    auto const x = at::randn({2, 3}, at::kFloat).to(at::kComplexFloat);
    auto const y = at::randn({3, 2}, at::kComplexFloat);
    auto const x_emu = on_emulator(x);
    REQUIRE(needs_fallback({x_emu, y}, caps));
    auto const out = mm(x_emu, y, caps);
    CHECK(out.device() == emulator::device());
    CHECK(close(on_host(out), at::mm(x, y)));
  }
}

TEST_CASE("Real operands on the restricted device take the fast path",
          "[guard][fastpath]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  auto const x = on_emulator(at::randn({4, 4}, at::kFloat));
  auto const y = on_emulator(at::randn({4, 4}, at::kFloat));
  auto const bx = on_emulator(at::randn({2, 4, 4}, at::kDouble));
  auto const by = on_emulator(at::randn({2, 4, 4}, at::kDouble));
  REQUIRE_FALSE(needs_fallback({x, y}, caps));

  emulator::reset_transfer_count();
  auto const out_contract = contract("ij,jk->ik", {x, y}, caps);
  auto const out_matmul = matmul(x, y, caps);
  auto const out_bmm = batched_matmul(bx, by, caps);
  auto const out_mm = mm(x, y, caps);
  CHECK(emulator::transfer_count() == 0);

  CHECK(out_contract.device() == emulator::device());
  CHECK(out_matmul.device() == emulator::device());
  CHECK(out_bmm.device() == emulator::device());
  CHECK(out_mm.device() == emulator::device());

  CHECK(at::equal(out_contract, at::einsum("ij,jk->ik", {x, y})));
  CHECK(at::equal(out_matmul, at::matmul(x, y)));
  CHECK(at::equal(out_bmm, at::bmm(bx, by)));
  CHECK(at::equal(out_mm, at::mm(x, y)));
}

TEST_CASE("Capable devices are never touched", "[guard][fastpath]")
{
  emulator::initialize();
  auto const* const caps = GENERATE(as<DeviceCapabilities const*> {},
                                   &default_capabilities(),
                                   &emulator::capabilities());

  auto const x = at::randn({3, 3}, at::kComplexFloat);
  auto const y = at::randn({3, 3}, at::kComplexFloat);
  auto const bx = at::randn({2, 3, 3}, at::kComplexFloat);
  auto const by = at::randn({2, 3, 3}, at::kComplexFloat);
  REQUIRE_FALSE(needs_fallback({x, y}, *caps));

  emulator::reset_transfer_count();
  CHECK(at::equal(contract("ij,jk->ik", {x, y}, *caps),
                  at::einsum("ij,jk->ik", {x, y})));
  CHECK(at::equal(matmul(x, y, *caps), at::matmul(x, y)));
  CHECK(at::equal(batched_matmul(bx, by, *caps), at::bmm(bx, by)));
  CHECK(at::equal(mm(x, y, *caps), at::mm(x, y)));
  CHECK(emulator::transfer_count() == 0);
}

TEST_CASE("Only the named device is restricted", "[guard][fastpath]")
{
  emulator::initialize();

  // With the default (MPS) capabilities the emulated device is just
  // another backend; its own refusal reaches the caller unchanged.
  auto const x = on_emulator(at::randn({2, 2}, at::kComplexFloat));
  auto const y = on_emulator(at::randn({2, 2}, at::kComplexFloat));
  REQUIRE_FALSE(needs_fallback({x, y}));

  emulator::reset_transfer_count();
  REQUIRE_THROWS_AS(mm(x, y), c10::NotImplementedError);
  REQUIRE_THROWS_AS(matmul(x, y), c10::NotImplementedError);
  CHECK(emulator::transfer_count() == 0);
}

TEST_CASE("Mixed real operands behave like the native primitive",
          "[guard][fastpath]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  auto const x = on_emulator(at::randn({3, 4}, at::kFloat));
  auto const y = at::randn({4, 2}, at::kFloat);

  auto const native = outcome_of([&] { return at::matmul(x, y); });

  emulator::reset_transfer_count();
  auto const wrapped = outcome_of([&] { return matmul(x, y, caps); });
  CHECK(emulator::transfer_count() == 0);

  REQUIRE(wrapped.threw == native.threw);
  if (!native.threw)
  {
    CHECK(wrapped.value->device() == native.value->device());
    CHECK(at::equal(on_host(*wrapped.value), on_host(*native.value)));
  }
}

TEST_CASE("Native errors propagate unchanged", "[guard][errors]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  SECTION("Shape mismatch on the fallback path")
  {
    auto const x = on_emulator(at::randn({2, 3}, at::kComplexFloat));
    auto const y = on_emulator(at::randn({2, 3}, at::kComplexFloat));
    REQUIRE_THROWS_AS(mm(x, y, caps), c10::Error);
    REQUIRE_THROWS_AS(batched_matmul(x, y, caps), c10::Error);
  }

  SECTION("Shape mismatch on the fast path")
  {
    auto const x = at::randn({2, 3}, at::kFloat);
    auto const y = at::randn({2, 3}, at::kFloat);
    REQUIRE_THROWS_AS(mm(x, y, caps), c10::Error);
    REQUIRE_THROWS_AS(contract("ij,jk->ik", {x, y}, caps), c10::Error);
  }

  SECTION("Shape mismatch on the fast path with restricted-device operands")
  {
    auto const x = on_emulator(at::randn({2, 3}, at::kFloat));
    auto const y = on_emulator(at::randn({2, 3}, at::kFloat));
    emulator::reset_transfer_count();
    REQUIRE_THROWS_AS(mm(x, y, caps), c10::Error);
    REQUIRE_THROWS_AS(contract("ij,jk->ik", {x, y}, caps), c10::Error);
    CHECK(emulator::transfer_count() == 0UL);

    // The inputs stay fully on the emulated device.
    CHECK(x.device() == emulator::device());
    CHECK(x.storage().device() == emulator::device());
    CHECK(y.storage().device() == emulator::device());

    // ... and remain usable afterwards.
    auto const w_host = at::randn({3, 2}, at::kFloat);
    auto const z = mm(x, on_emulator(w_host), caps);
    CHECK(z.device() == emulator::device());
    CHECK(close(on_host(z), at::mm(on_host(x), w_host)));
  }

  SECTION("Real dtype mismatch with restricted-device operands")
  {
    auto const x = on_emulator(at::randn({2, 2}, at::kFloat));
    auto const y = on_emulator(at::randn({2, 2}, at::kDouble));
    REQUIRE_THROWS_AS(mm(x, y, caps), c10::Error);
    CHECK(x.storage().device() == emulator::device());
    CHECK(y.storage().device() == emulator::device());
  }

  SECTION("Dtype mismatch")
  {
    auto const x = on_emulator(at::randn({2, 2}, at::kComplexFloat));
    auto const y = on_emulator(at::randn({2, 2}, at::kComplexDouble));
    REQUIRE_THROWS_AS(mm(x, y, caps), c10::Error);
  }

  SECTION("No operands")
  {
    REQUIRE_THROWS_AS(contract("->", {}, caps), c10::Error);
  }
}

TEST_CASE("Chained fallback calls stay on the restricted device",
          "[guard][fallback][composition]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  constexpr int n = 4;
  constexpr int steps = 6;

  // Keep the spectral radius small so powers stay well-scaled.
  auto const a_host = at::randn({n, n}, at::kComplexDouble).mul(0.25);
  auto const a = on_emulator(a_host);

  auto acc = on_emulator(at::eye(n, at::kComplexDouble));
  auto ref = at::eye(n, at::kComplexDouble);

  emulator::reset_transfer_count();
  for (int i = 0; i < steps; ++i)
  {
    acc = matmul(acc, a, caps);
    REQUIRE(acc.device() == emulator::device());
    ref = at::matmul(ref, a_host);
  }
  CHECK(emulator::transfer_count() == 3 * steps);
  CHECK(close(on_host(acc), ref));
}

TEST_CASE("Concurrent fallback calls", "[guard][fallback][threads]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();

  constexpr int num_threads = 4;
  constexpr int iters = 8;

  std::vector<at::Tensor> lhs, rhs, expected;
  for (int i = 0; i < num_threads; ++i)
  {
    lhs.push_back(at::randn({5, 3}, at::kComplexFloat));
    rhs.push_back(at::randn({3, 4}, at::kComplexFloat));
    expected.push_back(at::mm(lhs.back(), rhs.back()));
  }

  std::vector<at::Tensor> lhs_emu, rhs_emu;
  for (int i = 0; i < num_threads; ++i)
  {
    lhs_emu.push_back(on_emulator(lhs[i]));
    rhs_emu.push_back(on_emulator(rhs[i]));
  }

  std::atomic<int> good {0};
  emulator::reset_transfer_count();
  {
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i)
      threads.emplace_back([&, i] {
        for (int j = 0; j < iters; ++j)
        {
          auto const out = mm(lhs_emu[i], rhs_emu[i], caps);
          if (out.device() == emulator::device()
              && close(on_host(out), expected[i]))
            ++good;
        }
      });
    for (auto& t : threads)
      t.join();
  }

  CHECK(good.load() == num_threads * iters);
  // Three per call, plus one per on_host() check.
  CHECK(emulator::transfer_count()
        == static_cast<std::uint64_t>(4 * num_threads * iters));
}

TEST_CASE("Relocation helpers", "[guard][utils]")
{
  emulator::initialize();
  auto const& caps = emulator::capabilities();
  auto const dev = emulator::device();

  auto const a = on_emulator(at::randn({2, 2}, at::kComplexDouble));
  auto const b = at::randn({2, 2}, at::kComplexDouble);

  emulator::reset_transfer_count();
  auto const relocated = relocate_to_fallback(caps, {a, at::Tensor {}, b});
  REQUIRE(relocated.size() == 3UL);
  CHECK(emulator::transfer_count() == 1UL);
  CHECK(relocated[0].is_cpu());
  CHECK(relocated[0].dtype() == a.dtype());
  CHECK(relocated[0].sizes() == a.sizes());
  CHECK_FALSE(relocated[1].defined());
  CHECK(relocated[2].is_same(b));

  SECTION("A single tensor goes back")
  {
    auto const back = restore_device(relocated[0], dev);
    CHECK(back.device() == dev);
    CHECK(at::equal(on_host(back), on_host(a)));
  }

  SECTION("Every tensor in a tuple goes back")
  {
    auto const [x, y] =
      restore_device(std::make_tuple(relocated[0], relocated[2]), dev);
    CHECK(x.device() == dev);
    CHECK(y.device() == dev);
  }

  SECTION("Undefined tensors in a vector stay undefined")
  {
    auto const back = restore_device(relocated, dev);
    REQUIRE(back.size() == 3UL);
    CHECK(back[0].device() == dev);
    CHECK_FALSE(back[1].defined());
    CHECK(back[2].device() == dev);
  }
}
