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

#include <plsa/model/plsa_stats.hpp>
#include <plsa/util/plsa_error.hpp>
#include <glog/logging.h>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace plsa {

double PLSAStats::ComputeLLH(const TermDocMatrix& counts, const Matrix& theta,
    const Matrix& phi) {
  int32_t num_docs = counts.num_docs();
  int32_t vocab_size = counts.vocab_size();
  int32_t num_topics = phi.size();
  CHECK_EQ(num_docs, static_cast<int32_t>(theta.size()));

  double llh = 0.;
  for (int32_t d = 0; d < num_docs; ++d) {
    const std::vector<double>& doc_topic = theta[d];
    CHECK_EQ(num_topics, static_cast<int32_t>(doc_topic.size()));
    for (int32_t w = 0; w < vocab_size; ++w) {
      double mix = 0.;
      for (int32_t k = 0; k < num_topics; ++k) {
        mix += doc_topic[k] * phi[k][w];
      }
      if (mix == 0.) {
        std::stringstream ss;
        ss << "Topic mixture of doc " << d << " and word " << w
          << " is zero; log-likelihood undefined";
        throw PLSAError(kDegenerateLikelihood, ss.str(), d, w);
      }
      llh += counts(d, w) * std::log2(mix);
    }
  }
  if (std::isnan(llh)) {
    throw PLSAError(kDegenerateLikelihood, "Log-likelihood is NaN");
  }
  return llh;
}

double PLSAStats::GetLLH(int32_t ith_llh) const {
  CHECK_LE(0, ith_llh);
  CHECK_LT(ith_llh, GetNumLLH());
  return llh_[ith_llh];
}

std::string PLSAStats::PrintLLH() const {
  std::stringstream output;
  for (int32_t i = 0; i < GetNumLLH(); ++i) {
    output << PrintOneLLH(i);
  }
  return output.str();
}

std::string PLSAStats::PrintOneLLH(int32_t ith_llh) const {
  std::stringstream output;
  output << (ith_llh + 1) << " " << std::setprecision(12)
    << GetLLH(ith_llh) << std::endl;
  return output.str();
}

}  // namespace plsa
