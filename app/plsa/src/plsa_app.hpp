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

#include <plsa/include/plsa.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace plsa {

// PLSAApp takes care of the entire pipeline: reading the corpus, fitting
// the model (restarting on failure), and reporting the topics and the
// log-likelihood trace.
class PLSAApp {
public:
  // Reads the configuration from Context and loads the corpus. Sets
  // "num_docs" and "vocab_size" in Context.
  PLSAApp();

  // Returns the process exit status: 0 unless the arguments were invalid
  // or the last fitting attempt failed.
  int Run();

private:  // private functions
  // Calls EMEngine::Fit up to num_restarts_ + 1 times, with a fresh seed
  // each time, until a run does not fail.
  FitResult FitWithRestarts(const TermDocMatrix& counts, InitMode init_mode);

  void PrintTopWords(const Matrix& phi) const;

  void PrintDocTopics(const Matrix& theta) const;

  void SaveLLH(const std::vector<double>& llh) const;

private:  // private data
  Corpus corpus_;

  // number of topics
  int32_t K_;

  int32_t max_iterations_;

  double epsilon_;

  std::string init_mode_;

  // Seed of the first attempt. Attempt i uses seed_ + i.
  uint32_t seed_;

  int32_t num_restarts_;

  int32_t num_top_words_;

  std::string output_file_prefix_;
};

}   // namespace plsa
