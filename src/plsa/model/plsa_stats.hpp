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
#include <plsa/corpus/term_doc_matrix.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace plsa {

// Tracks the corpus log-likelihood, one value per completed EM iteration.
// The trace is append-only.
class PLSAStats {
public:
  PLSAStats() { }

  // Corpus log-likelihood in base 2:
  //
  //   sum_{d,w} C[d][w] * log2(sum_k theta[d][k] * phi[k][w])
  //
  // Throws PLSAError(kDegenerateLikelihood) for the first (d, w) whose
  // mixture is zero.
  static double ComputeLLH(const TermDocMatrix& counts, const Matrix& theta,
      const Matrix& phi);

  void AppendLLH(double llh) { llh_.push_back(llh); }

  const std::vector<double>& GetLLHTrace() const { return llh_; }

  int32_t GetNumLLH() const { return llh_.size(); }

  // 0-based.
  double GetLLH(int32_t ith_llh) const;

  // Return a string of two columns: "iter-# llh", iterations 1-based.
  std::string PrintLLH() const;

  std::string PrintOneLLH(int32_t ith_llh) const;

private:
  std::vector<double> llh_;
};

}  // namespace plsa
