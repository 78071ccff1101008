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

#include <plsa/util/plsa_error.hpp>
#include <sstream>

namespace plsa {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case kInvalidDistribution:
      return "InvalidDistribution";
    case kDegenerateEStep:
      return "DegenerateEStep";
    case kDegenerateLikelihood:
      return "DegenerateLikelihood";
    case kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

PLSAError::PLSAError(ErrorCode code, const std::string& what, int32_t doc_id,
    int32_t word_id) :
    std::runtime_error(what),
    code_(code),
    doc_id_(doc_id),
    word_id_(word_id),
    iteration_(-1) { }

std::string PLSAError::DebugString() const {
  std::stringstream ss;
  ss << ErrorCodeName(code_) << ": " << what();
  if (iteration_ >= 0) {
    ss << " [iteration " << iteration_ + 1 << "]";
  }
  return ss.str();
}

}  // namespace plsa
