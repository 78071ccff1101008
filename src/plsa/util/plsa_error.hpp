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

#include <stdexcept>
#include <string>
#include <cstdint>

namespace plsa {

enum ErrorCode {
  // A row meant to be normalized sums to zero.
  kInvalidDistribution = 0,
  // Every topic gives zero mass to some (document, word) pair in the E-step.
  kDegenerateEStep = 1,
  // The topic mixture of some (document, word) pair is zero in the
  // log-likelihood.
  kDegenerateLikelihood = 2,
  // Non-positive topic count or iteration budget, or negative epsilon.
  kInvalidArgument = 3
};

const char* ErrorCodeName(ErrorCode code);

// All failures of a fitting run are reported through PLSAError. None of them
// is recoverable within the run; retrying is up to the caller.
class PLSAError : public std::runtime_error {
public:
  // doc_id / word_id are -1 when not applicable. For kInvalidDistribution
  // word_id is unused and doc_id holds the offending row.
  PLSAError(ErrorCode code, const std::string& what, int32_t doc_id = -1,
      int32_t word_id = -1);

  ErrorCode code() const { return code_; }

  int32_t doc_id() const { return doc_id_; }

  int32_t word_id() const { return word_id_; }

  // -1 until the EM engine stamps the failing iteration (0-based).
  int32_t iteration() const { return iteration_; }

  void set_iteration(int32_t iteration) { iteration_ = iteration; }

  // Message including code name, iteration and indices.
  std::string DebugString() const;

private:
  ErrorCode code_;
  int32_t doc_id_;
  int32_t word_id_;
  int32_t iteration_;
};

}  // namespace plsa
