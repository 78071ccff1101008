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
#include <glog/logging.h>
#include <algorithm>
#include <sstream>

namespace plsa {

void RowNormalize(Matrix* m) {
  CHECK_NOTNULL(m);
  std::vector<double> row_sums(m->size());
  for (size_t i = 0; i < m->size(); ++i) {
    row_sums[i] = RowSum((*m)[i]);
    if (row_sums[i] == 0.) {
      std::stringstream ss;
      ss << "Error while normalizing. Row " << i << " of a "
        << m->size() << "-row matrix sums to zero";
      throw PLSAError(kInvalidDistribution, ss.str(), i);
    }
  }
  for (size_t i = 0; i < m->size(); ++i) {
    std::vector<double>& row = (*m)[i];
    for (size_t j = 0; j < row.size(); ++j) {
      row[j] /= row_sums[i];
    }
  }
}

Matrix MakeMatrix(int32_t rows, int32_t cols, double val) {
  CHECK_LE(0, rows);
  CHECK_LE(0, cols);
  return Matrix(rows, std::vector<double>(cols, val));
}

double RowSum(const std::vector<double>& row) {
  double sum = 0.;
  for (size_t j = 0; j < row.size(); ++j) {
    sum += row[j];
  }
  return sum;
}

int32_t ArgMax(const std::vector<double>& row) {
  CHECK(!row.empty()) << "ArgMax of an empty row";
  int32_t max_idx = 0;
  for (size_t j = 1; j < row.size(); ++j) {
    if (row[j] > row[max_idx]) {
      max_idx = j;
    }
  }
  return max_idx;
}

std::vector<int32_t> TopN(const std::vector<double>& row, int32_t n) {
  std::vector<int32_t> indices(row.size());
  for (size_t j = 0; j < row.size(); ++j) {
    indices[j] = j;
  }
  int32_t num_top = std::min(static_cast<int32_t>(row.size()),
      std::max(n, 0));
  std::partial_sort(indices.begin(), indices.begin() + num_top, indices.end(),
      [&row](int32_t a, int32_t b) {
        return row[a] > row[b] || (row[a] == row[b] && a < b);
      });
  indices.resize(num_top);
  return indices;
}

}  // namespace plsa
