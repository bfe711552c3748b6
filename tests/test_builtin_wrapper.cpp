/*
 * Kontra - continuation-passing style conversion for probabilistic programs
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "kontra/builtin_wrapper.hpp"
#include "kontra/equality.hpp"
#include "kontra/exceptions.hpp"

#include "support/evaluator.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>


namespace {

class BuiltinWrapperTest: public testing::Test {
  protected:
  void
  SetUp() override
  {
    gensym_counter = 0;
    gensym = std::make_unique<kon::symbol_generator>(gensym_counter, "_w{}");
  }

  static std::string
  show(kon::term t)
  {
    std::ostringstream buf;
    buf << t;
    return buf.str();
  }

  size_t gensym_counter;
  std::unique_ptr<kon::symbol_generator> gensym;
};


TEST_F(BuiltinWrapperTest, IdentityContinuation)
{
  const kon::term id = kon::identity_continuation(*gensym);
  ASSERT_TRUE(kon::islam(id));
  EXPECT_TRUE(kon::isvar(kon::lam_body(id), kon::lam_param(id)));
  EXPECT_EQ(show(id), "(fun _w1 -> _w1)");
}


TEST_F(BuiltinWrapperTest, Arities)
{
  EXPECT_EQ(kon::builtin_arity(kon::concat()), 2);
  EXPECT_EQ(kon::builtin_arity(kon::infer()), 1);
  EXPECT_EQ(kon::builtin_arity(kon::logpdf()), 2);
  EXPECT_EQ(kon::builtin_arity(kon::utest()), 2);
  EXPECT_THROW((void)kon::builtin_arity(kon::sample()), std::invalid_argument);
}


TEST_F(BuiltinWrapperTest, ArityZeroIsUnchanged)
{
  const kon::term n = kon::number(42);
  EXPECT_TRUE(kon::is(kon::wrap_builtin(n, 0, *gensym), n));
  EXPECT_TRUE(kon::is(kon::wrap_constant(n, *gensym), n));
  EXPECT_EQ(gensym_counter, 0);
}


TEST_F(BuiltinWrapperTest, UnaryShape)
{
  const kon::term t = kon::wrap_builtin(kon::infer(), 1, *gensym);
  // fun k -> fun v -> k (Infer v)
  const kon::term expected =
      kon::lam("k", kon::lam("v", kon::app(kon::var("k"),
                                           kon::app(kon::infer(),
                                                    kon::var("v")))));
  EXPECT_TRUE(kon::alpha_equal(t, expected)) << t;
}


TEST_F(BuiltinWrapperTest, BinaryShape)
{
  const kon::term t = kon::wrap_constant(kon::primitive("add", 2), *gensym);
  // fun k1 -> fun v1 -> k1 (fun k2 -> fun v2 -> k2 (add v1 v2))
  const kon::term expected = kon::lam(
      "k1",
      kon::lam("v1",
               kon::app(kon::var("k1"),
                        kon::lam("k2",
                                 kon::lam("v2",
                                          kon::app(kon::var("k2"),
                                                   kon::app(kon::primitive(
                                                                "add", 2),
                                                            kon::var("v1"),
                                                            kon::var("v2"))))))));
  EXPECT_TRUE(kon::alpha_equal(t, expected)) << t;
  // Two arguments and two continuations
  EXPECT_EQ(gensym_counter, 4);
}


TEST_F(BuiltinWrapperTest, WrappedPrimitiveComputes)
{
  const kon::term t = kon::wrap_constant(kon::primitive("sub", 2), *gensym);
  const kon::test::evaluator eval;
  const kon::test::value *f = eval(t);
  const kon::test::value *partial = eval.apply_cps(f, kon::test::make_number(10));
  const kon::test::value *result =
      eval.apply_cps(partial, kon::test::make_number(4));
  EXPECT_EQ(kon::test::show(result), "6");
}


TEST_F(BuiltinWrapperTest, WrapConstantRejectsOtherNodes)
{
  EXPECT_THROW((void)kon::wrap_constant(kon::var("x"), *gensym),
               kon::internal_error);
}


TEST_F(BuiltinWrapperTest, FixShape)
{
  const kon::term t = kon::wrap_fix(kon::fix(), *gensym);
  // fun k -> fun v -> k (fix (v (fun x -> x)))
  const kon::term expected = kon::lam(
      "k", kon::lam("v", kon::app(kon::var("k"),
                                  kon::app(kon::fix(),
                                           kon::app(kon::var("v"),
                                                    kon::lam("x", kon::var("x")))))));
  EXPECT_TRUE(kon::alpha_equal(t, expected)) << t;
}

} // anonymous namespace
