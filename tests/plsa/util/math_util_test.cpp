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

#include <plsa/util/math_util.hpp>
#include <plsa/util/plsa_error.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace plsa {

TEST(MathUtilTest, RowNormalize) {
  Matrix m(2);
  m[0] = {1., 3.};
  m[1] = {2., 2.};
  RowNormalize(&m);
  EXPECT_DOUBLE_EQ(0.25, m[0][0]);
  EXPECT_DOUBLE_EQ(0.75, m[0][1]);
  EXPECT_DOUBLE_EQ(0.5, m[1][0]);
  EXPECT_DOUBLE_EQ(0.5, m[1][1]);
}

TEST(MathUtilTest, RowNormalizeZeroRow) {
  Matrix m(3);
  m[0] = {1., 1.};
  m[1] = {0., 0.};
  m[2] = {4., 0.};
  try {
    RowNormalize(&m);
    FAIL() << "Expected PLSAError";
  } catch (const PLSAError& e) {
    EXPECT_EQ(kInvalidDistribution, e.code());
    EXPECT_EQ(1, e.doc_id());
  }
  // Nothing is divided when a row can't be normalized.
  EXPECT_EQ(1., m[0][0]);
  EXPECT_EQ(4., m[2][0]);
}

TEST(MathUtilTest, RowNormalizeEmptyColumns) {
  // Rows without columns sum to zero as well.
  Matrix m = MakeMatrix(2, 0, 1.);
  EXPECT_THROW(RowNormalize(&m), PLSAError);

  Matrix no_rows;
  RowNormalize(&no_rows);
  EXPECT_TRUE(no_rows.empty());
}

TEST(MathUtilTest, MakeMatrix) {
  Matrix m = MakeMatrix(3, 4, 0.5);
  ASSERT_EQ(3, m.size());
  for (const auto& row : m) {
    ASSERT_EQ(4, row.size());
    EXPECT_DOUBLE_EQ(2., RowSum(row));
  }
}

TEST(MathUtilTest, ArgMaxAndTopN) {
  std::vector<double> row = {0.1, 0.4, 0.2, 0.4, 0.0};
  EXPECT_EQ(1, ArgMax(row));

  std::vector<int32_t> top = TopN(row, 3);
  ASSERT_EQ(3, top.size());
  EXPECT_EQ(1, top[0]);
  EXPECT_EQ(3, top[1]);
  EXPECT_EQ(2, top[2]);

  EXPECT_EQ(5, TopN(row, 10).size());
  EXPECT_TRUE(TopN(row, 0).empty());
}

TEST(MathUtilTest, ErrorCodeName) {
  EXPECT_STREQ("InvalidDistribution", ErrorCodeName(kInvalidDistribution));
  EXPECT_STREQ("DegenerateEStep", ErrorCodeName(kDegenerateEStep));
  EXPECT_STREQ("DegenerateLikelihood", ErrorCodeName(kDegenerateLikelihood));
  EXPECT_STREQ("InvalidArgument", ErrorCodeName(kInvalidArgument));

  PLSAError e(kDegenerateEStep, "zero mass", 2, 5);
  e.set_iteration(3);
  EXPECT_EQ(3, e.iteration());
  EXPECT_EQ("DegenerateEStep: zero mass [iteration 4]", e.DebugString());
}

}  // namespace plsa
