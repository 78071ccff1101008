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

#pragma once

#include <plsa/include/types.hpp>
#include <string>
#include <vector>
#include <sstream>

namespace plsa {

template<typename V>
std::string VectorToString(const std::vector<V>& v) {
  std::stringstream ss;
  for (size_t i = 0; i < v.size(); ++i) {
    ss << v[i] << " ";
  }
  return ss.str();
}

// Divide every entry by its row sum so that each row sums to 1. Throws
// PLSAError(kInvalidDistribution) naming the first row that sums to zero;
// 'm' is left untouched in that case.
void RowNormalize(Matrix* m);

// Allocate a rows x cols matrix filled with 'val'.
Matrix MakeMatrix(int32_t rows, int32_t cols, double val);

double RowSum(const std::vector<double>& row);

// Index of the largest entry; ties go to the lowest index.
int32_t ArgMax(const std::vector<double>& row);

// Indices of the 'n' largest entries in decreasing order.
std::vector<int32_t> TopN(const std::vector<double>& row, int32_t n);

}  // namespace plsa
