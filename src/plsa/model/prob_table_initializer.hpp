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
#include <boost/random/mersenne_twister.hpp>
#include <cstdint>
#include <string>

namespace plsa {

enum InitMode {
  // All ones before normalization: theta = 1/K, phi = 1/V. This is a fixed
  // point of the EM recurrence, so it is only useful for testing.
  kUniformInit = 0,
  // Entries drawn from U[0, 1), then row-normalized.
  kRandomInit = 1
};

// Parses "uniform" / "random". Throws PLSAError(kInvalidArgument) otherwise.
InitMode ParseInitMode(const std::string& name);

const char* InitModeName(InitMode mode);

// Produces the starting P(topic|doc) (theta, D x K) and P(word|topic)
// (phi, K x V) tables, both row-normalized.
class ProbTableInitializer {
public:
  explicit ProbTableInitializer(InitMode mode, uint32_t seed = 1);

  // Resizes and fills 'theta' and 'phi'. Throws
  // PLSAError(kInvalidDistribution) if a row can't be normalized (e.g.
  // vocab_size == 0).
  void Init(int32_t num_docs, int32_t num_topics, int32_t vocab_size,
      Matrix* theta, Matrix* phi);

  InitMode mode() const { return mode_; }

private:
  void FillRandom(Matrix* m);

private:
  InitMode mode_;

  boost::mt19937 gen_;
};

}  // namespace plsa
