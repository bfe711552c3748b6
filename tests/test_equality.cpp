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


#include "kontra/equality.hpp"
#include "kontra/term.hpp"

#include <gtest/gtest.h>


namespace {

// Test fixture for equality tests
class EqualityTest: public testing::Test { };


// Test equality of identical objects (is)
TEST_F(EqualityTest, IdenticalObjects)
{
  const kon::term t = kon::lam("x", kon::var("x"));
  EXPECT_TRUE(kon::is(t, t));
  EXPECT_TRUE(kon::equal(t, t));
  EXPECT_TRUE(kon::alpha_equal(t, t));
}


TEST_F(EqualityTest, Variables)
{
  // Different nodes with the same name are equal
  EXPECT_FALSE(kon::is(kon::var("x"), kon::var("x")));
  EXPECT_TRUE(kon::equal(kon::var("x"), kon::var("x")));
  EXPECT_FALSE(kon::equal(kon::var("x"), kon::var("y")));
  // Free variables are never renamed
  EXPECT_FALSE(kon::alpha_equal(kon::var("x"), kon::var("y")));
}


TEST_F(EqualityTest, Constants)
{
  EXPECT_TRUE(kon::equal(kon::number(1), kon::number(1)));
  EXPECT_FALSE(kon::equal(kon::number(1), kon::number(2)));
  EXPECT_FALSE(kon::equal(kon::number(1), kon::boolean(true)));
  EXPECT_TRUE(kon::equal(kon::unit(), kon::unit()));
  EXPECT_TRUE(kon::equal(kon::primitive("add", 2), kon::primitive("add", 2)));
  EXPECT_FALSE(kon::equal(kon::primitive("add", 2), kon::primitive("add", 3)));
  EXPECT_FALSE(kon::equal(kon::primitive("add", 2), kon::primitive("mul", 2)));
}


TEST_F(EqualityTest, Builtins)
{
  EXPECT_TRUE(kon::equal(kon::concat(), kon::concat()));
  EXPECT_FALSE(kon::equal(kon::concat(), kon::utest()));
  EXPECT_FALSE(kon::equal(kon::infer(), kon::infer(kon::var("m"))));
  EXPECT_TRUE(kon::equal(kon::sample(kon::var("d")), kon::sample(kon::var("d"))));
  EXPECT_FALSE(kon::equal(kon::weight(kon::var("w")),
                          kon::weight(std::nullopt, kon::var("w"))));
}


TEST_F(EqualityTest, Lambdas)
{
  const kon::term a = kon::lam("x", kon::var("x"));
  const kon::term b = kon::lam("y", kon::var("y"));
  const kon::term c = kon::lam("y", kon::var("x"));

  EXPECT_FALSE(kon::equal(a, b));
  EXPECT_TRUE(kon::alpha_equal(a, b));
  EXPECT_FALSE(kon::alpha_equal(a, c));
}


TEST_F(EqualityTest, Shadowing)
{
  // fun x -> fun x -> x  vs  fun a -> fun b -> b
  const kon::term a = kon::lam("x", kon::lam("x", kon::var("x")));
  const kon::term b = kon::lam("a", kon::lam("b", kon::var("b")));
  const kon::term c = kon::lam("a", kon::lam("b", kon::var("a")));
  EXPECT_TRUE(kon::alpha_equal(a, b));
  EXPECT_FALSE(kon::alpha_equal(a, c));
}


TEST_F(EqualityTest, BoundAgainstFree)
{
  // fun x -> y  vs  fun y -> y
  const kon::term a = kon::lam("x", kon::var("y"));
  const kon::term b = kon::lam("y", kon::var("y"));
  EXPECT_FALSE(kon::alpha_equal(a, b));
  EXPECT_FALSE(kon::alpha_equal(b, a));
}


TEST_F(EqualityTest, MatchBinders)
{
  const auto m = [](std::string_view h, std::string_view t) {
    return kon::match(
        kon::var("xs"),
        {{kon::pat::cons(kon::pat::variable(h), kon::pat::variable(t)),
          kon::tup({kon::var(t), kon::var(h)})},
         {kon::pat::nil(), kon::var("xs")}});
  };

  EXPECT_TRUE(kon::equal(m("h", "t"), m("h", "t")));
  EXPECT_FALSE(kon::equal(m("h", "t"), m("a", "b")));
  EXPECT_TRUE(kon::alpha_equal(m("h", "t"), m("a", "b")));

  // Binders of one arm are not visible in the next one
  const kon::term a = kon::match(
      kon::var("s"), {{kon::pat::variable("x"), kon::var("x")},
                      {kon::pat::wildcard(), kon::var("x")}});
  const kon::term b = kon::match(
      kon::var("s"), {{kon::pat::variable("y"), kon::var("y")},
                      {kon::pat::wildcard(), kon::var("y")}});
  EXPECT_FALSE(kon::alpha_equal(a, b));
}


TEST_F(EqualityTest, PatternsMustAgree)
{
  const kon::term a = kon::match(
      kon::var("s"), {{kon::pat::literal(kon::number(1)), kon::unit()}});
  const kon::term b = kon::match(
      kon::var("s"), {{kon::pat::literal(kon::number(2)), kon::unit()}});
  const kon::term c = kon::match(kon::var("s"), {{kon::pat::wildcard(),
                                                  kon::unit()}});
  EXPECT_FALSE(kon::equal(a, b));
  EXPECT_FALSE(kon::alpha_equal(a, c));
}


TEST_F(EqualityTest, Aggregates)
{
  const kon::term r1 = kon::rec({{"a", kon::number(1)}, {"b", kon::unit()}});
  const kon::term r2 = kon::rec({{"a", kon::number(1)}, {"b", kon::unit()}});
  const kon::term r3 = kon::rec({{"b", kon::unit()}, {"a", kon::number(1)}});
  EXPECT_TRUE(kon::equal(r1, r2));
  // Field order is significant
  EXPECT_FALSE(kon::equal(r1, r3));

  EXPECT_FALSE(kon::equal(kon::tup({kon::unit()}), kon::list({kon::unit()})));
  EXPECT_FALSE(kon::equal(kon::tup({kon::unit()}),
                          kon::tup({kon::unit(), kon::unit()})));
  EXPECT_FALSE(kon::equal(kon::tup_proj(kon::var("t"), 0),
                          kon::tup_proj(kon::var("t"), 1)));
  EXPECT_FALSE(kon::equal(kon::rec_proj(kon::var("r"), "a"),
                          kon::rec_proj(kon::var("r"), "b")));
}

} // anonymous namespace
