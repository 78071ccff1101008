// Copyright (c) 2014, Sailing Lab
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
// this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
// notice, this list of conditions and the following disclaimer in the
// documentation and/or other materials provided with the distribution.
//
// 3. Neither the name of the <ORGANIZATION> nor the names of its contributors
// may be used to endorse or promote products derived from this software
// without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

#include <plsa/model/prob_table_initializer.hpp>
#include <plsa/util/math_util.hpp>
#include <plsa/util/plsa_error.hpp>
#include <gtest/gtest.h>
#include <cmath>

namespace plsa {

namespace {

const double kTolerance = 1e-9;

void ExpectRowStochastic(const Matrix& m) {
  for (const auto& row : m) {
    EXPECT_NEAR(1., RowSum(row), kTolerance);
    for (double val : row) {
      EXPECT_LE(0., val);
    }
  }
}

}  // anonymous namespace

TEST(ProbTableInitializerTest, Uniform) {
  ProbTableInitializer initializer(kUniformInit);
  Matrix theta, phi;
  initializer.Init(3, 4, 5, &theta, &phi);

  ASSERT_EQ(3, theta.size());
  ASSERT_EQ(4, phi.size());
  for (const auto& row : theta) {
    ASSERT_EQ(4, row.size());
    for (double val : row) {
      EXPECT_DOUBLE_EQ(0.25, val);
    }
  }
  for (const auto& row : phi) {
    ASSERT_EQ(5, row.size());
    for (double val : row) {
      EXPECT_DOUBLE_EQ(0.2, val);
    }
  }
}

TEST(ProbTableInitializerTest, Random) {
  ProbTableInitializer initializer(kRandomInit, 17);
  Matrix theta, phi;
  initializer.Init(10, 3, 8, &theta, &phi);

  ExpectRowStochastic(theta);
  ExpectRowStochastic(phi);

  // Not the uniform tables.
  bool differs = false;
  for (const auto& row : phi) {
    for (double val : row) {
      differs = differs || std::fabs(val - 1. / 8) > kTolerance;
    }
  }
  EXPECT_TRUE(differs);
}

TEST(ProbTableInitializerTest, SameSeedSameTables) {
  ProbTableInitializer init1(kRandomInit, 5);
  ProbTableInitializer init2(kRandomInit, 5);
  Matrix theta1, phi1, theta2, phi2;
  init1.Init(4, 2, 6, &theta1, &phi1);
  init2.Init(4, 2, 6, &theta2, &phi2);
  EXPECT_EQ(theta1, theta2);
  EXPECT_EQ(phi1, phi2);

  // The generator advances between calls.
  Matrix theta3, phi3;
  init1.Init(4, 2, 6, &theta3, &phi3);
  EXPECT_NE(theta1, theta3);
}

TEST(ProbTableInitializerTest, EmptyVocabulary) {
  ProbTableInitializer initializer(kUniformInit);
  Matrix theta, phi;
  try {
    initializer.Init(2, 2, 0, &theta, &phi);
    FAIL() << "Expected PLSAError";
  } catch (const PLSAError& e) {
    EXPECT_EQ(kInvalidDistribution, e.code());
  }
}

TEST(ProbTableInitializerTest, ParseInitMode) {
  EXPECT_EQ(kUniformInit, ParseInitMode("uniform"));
  EXPECT_EQ(kRandomInit, ParseInitMode("random"));
  EXPECT_STREQ("random", InitModeName(kRandomInit));
  try {
    ParseInitMode("gibbs");
    FAIL() << "Expected PLSAError";
  } catch (const PLSAError& e) {
    EXPECT_EQ(kInvalidArgument, e.code());
  }
}

}  // namespace plsa
