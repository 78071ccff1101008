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
#include <plsa/model/plsa_stats.hpp>
#include <plsa/util/plsa_error.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace plsa {

// Uninitialized -> Initialized -> Iterating -> Converged | BudgetExhausted
// | Failed.
enum FitState {
  kUninitialized = 0,
  kInitialized = 1,
  kIterating = 2,
  kConverged = 3,
  // Reached max_iterations without converging. Not an error.
  kBudgetExhausted = 4,
  kFailed = 5
};

const char* FitStateName(FitState state);

// Working state of one Fit() call. Owned by the EM engine; nothing else
// touches it while iterating.
struct FitSession {
  FitSession() : state(kUninitialized), num_topics(0) { }

  FitState state;

  int32_t num_topics;

  // P(z | d), D x K.
  Matrix theta;

  // P(w | z), K x V.
  Matrix phi;

  // P(z | d, w) as z[d][k][w]. Recomputed by every E-step.
  Tensor z;

  PLSAStats stats;
};

struct FitResult {
  FitResult() :
    terminal_state(kUninitialized),
    num_iterations(0),
    error_code(kInvalidArgument),
    seconds(0.) { }

  bool failed() const { return terminal_state == kFailed; }

  // One of kConverged, kBudgetExhausted or kFailed.
  FitState terminal_state;

  // Final tables. Empty when the run failed.
  Matrix theta;
  Matrix phi;

  // One log2-likelihood per completed iteration.
  std::vector<double> llh;

  int32_t num_iterations;

  // Only meaningful when failed().
  ErrorCode error_code;
  std::string error_message;

  // Wall time of the whole fit.
  double seconds;
};

}  // namespace plsa
