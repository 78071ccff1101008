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

#include <plsa/corpus/term_doc_matrix.hpp>
#include <plsa/model/fit_session.hpp>
#include <plsa/model/prob_table_initializer.hpp>
#include <cstdint>
#include <vector>

namespace plsa {

// EMEngine fits a PLSA model to a term-document matrix by
// Expectation-Maximization. Every iteration runs, in this order:
//
//   E-step:     z[d][k][w] = theta[d][k] * phi[k][w] / sum_k'(...)
//   M-step:     phi[k][w]   ~ sum_d C[d][w] * z[d][k][w]   (row-normalized)
//               theta[d][k] ~ sum_w C[d][w] * z[d][k][w]   (row-normalized)
//   Likelihood: sum_{d,w} C[d][w] * log2(sum_k theta[d][k] * phi[k][w])
//
// Both M-step updates read the same z snapshot. Fitting stops when the
// log-likelihood changes by less than epsilon between two consecutive
// iterations, when max_iterations is reached, or on the first PLSAError.
class EMEngine {
public:
  // Does not take ownership. 'counts' and 'initializer' must outlive the
  // engine.
  EMEngine(const TermDocMatrix& counts, ProbTableInitializer* initializer);

  virtual ~EMEngine() { }

  // Runs a fresh fitting session. Throws PLSAError(kInvalidArgument) before
  // doing any work if num_topics < 1, max_iterations < 1 or epsilon < 0.
  // Any other PLSAError ends the run in kFailed and is reported in the
  // result instead of being thrown.
  FitResult Fit(int32_t num_topics, int32_t max_iterations, double epsilon);

  // The individual steps, exposed so the invariants can be tested in
  // isolation. Fit() is the only caller in normal operation. EStep and
  // MStep are virtual so a subclass can observe or perturb each iteration.

  // Fills session->theta / phi through the initializer and allocates a
  // zeroed z. Moves session to kInitialized.
  void Initialize(int32_t num_topics, FitSession* session);

  // Recomputes session->z from theta and phi, reallocating z if it is not
  // D x K x V. Throws PLSAError(kDegenerateEStep) if all topics give zero
  // mass to a (d, w) pair.
  virtual void EStep(FitSession* session) const;

  // Re-estimates phi, then theta, from the counts and session->z. Throws
  // PLSAError(kInvalidDistribution) if a row can't be normalized. Dies if
  // z is not D x K x V.
  virtual void MStep(FitSession* session) const;

  // Appends the log-likelihood of the current tables to the session trace
  // and returns it.
  double UpdateLLH(FitSession* session) const;

  // True when the last two entries of 'llh' differ by less than epsilon,
  // or not at all.
  static bool IsConverged(const std::vector<double>& llh, double epsilon);

private:
  void CheckArguments(int32_t num_topics, int32_t max_iterations,
      double epsilon) const;

  // Dies unless theta is D x K and phi is K x V.
  void CheckShapes(const FitSession& session) const;

  bool HasPosteriorShape(const FitSession& session) const;

private:
  const TermDocMatrix& counts_;

  ProbTableInitializer* initializer_;
};

}  // namespace plsa
