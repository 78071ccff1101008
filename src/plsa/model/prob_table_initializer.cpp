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
#include <boost/random/uniform_real.hpp>
#include <boost/random/variate_generator.hpp>
#include <glog/logging.h>

namespace plsa {

typedef boost::variate_generator<boost::mt19937&,
        boost::uniform_real<double> > rng_t;

InitMode ParseInitMode(const std::string& name) {
  if (name == "uniform") {
    return kUniformInit;
  } else if (name == "random") {
    return kRandomInit;
  }
  throw PLSAError(kInvalidArgument, "Unknown init mode: " + name
      + " (expect 'uniform' or 'random')");
}

const char* InitModeName(InitMode mode) {
  return (mode == kUniformInit) ? "uniform" : "random";
}

ProbTableInitializer::ProbTableInitializer(InitMode mode, uint32_t seed) :
    mode_(mode), gen_(seed) { }

void ProbTableInitializer::Init(int32_t num_docs, int32_t num_topics,
    int32_t vocab_size, Matrix* theta, Matrix* phi) {
  CHECK_NOTNULL(theta);
  CHECK_NOTNULL(phi);
  *theta = MakeMatrix(num_docs, num_topics, 1.);
  *phi = MakeMatrix(num_topics, vocab_size, 1.);
  if (mode_ == kRandomInit) {
    FillRandom(theta);
    FillRandom(phi);
  }
  RowNormalize(theta);
  RowNormalize(phi);
  VLOG(1) << "Initialized " << InitModeName(mode_) << " theta ("
    << num_docs << " x " << num_topics << ") and phi (" << num_topics
    << " x " << vocab_size << ")";
}

void ProbTableInitializer::FillRandom(Matrix* m) {
  rng_t rng(gen_, boost::uniform_real<double>(0., 1.));
  for (auto& row : *m) {
    for (double& val : row) {
      val = rng();
    }
  }
}

}  // namespace plsa
