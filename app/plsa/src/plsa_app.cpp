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

#include "plsa_app.hpp"
#include <glog/logging.h>
#include <ctime>
#include <fstream>
#include <sstream>

namespace plsa {

PLSAApp::PLSAApp() {
  Context& context = Context::get_instance();
  K_ = context.get_int32("num_topics");
  max_iterations_ = context.get_int32("max_iterations");
  epsilon_ = context.get_double("epsilon");
  init_mode_ = context.get_string("init_mode");
  int32_t seed = context.get_int32("seed");
  seed_ = (seed < 0) ? static_cast<uint32_t>(time(NULL))
    : static_cast<uint32_t>(seed);
  num_restarts_ = context.get_int32("num_restarts");
  num_top_words_ = context.get_int32("num_top_words");
  output_file_prefix_ = context.get_string("output_file_prefix");

  std::string doc_file = context.get_string("doc_file");
  HighResolutionTimer loading_timer;
  corpus_.ReadFile(doc_file);
  LOG(INFO) << "Read " << doc_file << " in " << loading_timer.elapsed()
    << " sec";
  LOG(INFO) << "Vocabulary: " << VectorToString(corpus_.GetVocabulary());
  LOG(INFO) << "Vocabulary size: " << corpus_.GetVocabSize();
  LOG(INFO) << "Number of documents: " << corpus_.GetNumDocs();
  LOG(INFO) << "Number of tokens: " << corpus_.GetNumTokens();
  LOG_IF(WARNING, corpus_.GetNumEmptyDocs() > 0)
    << corpus_.GetNumEmptyDocs() << " documents are empty; fitting will fail";

  context.set("num_docs", corpus_.GetNumDocs());
  context.set("vocab_size", corpus_.GetVocabSize());
}

int PLSAApp::Run() {
  FitResult result;
  try {
    InitMode init_mode = ParseInitMode(init_mode_);
    TermDocMatrix counts(corpus_.GetDocuments(), corpus_.GetVocabulary());
    LOG(INFO) << "Built " << counts.num_docs() << " x " << counts.vocab_size()
      << " term-document matrix, " << counts.GetTotalCount() << " tokens";
    result = FitWithRestarts(counts, init_mode);
  } catch (const PLSAError& e) {
    LOG(ERROR) << e.DebugString();
    return 1;
  }

  SaveLLH(result.llh);
  if (result.failed()) {
    LOG(ERROR) << "No usable model: " << result.error_message;
    return 1;
  }
  LOG_IF(WARNING, result.terminal_state == kBudgetExhausted)
    << "Reached max_iterations = " << max_iterations_
    << " before the log-likelihood converged";
  PrintTopWords(result.phi);
  PrintDocTopics(result.theta);
  return 0;
}

FitResult PLSAApp::FitWithRestarts(const TermDocMatrix& counts,
    InitMode init_mode) {
  FitResult result;
  for (int32_t attempt = 0; attempt <= num_restarts_; ++attempt) {
    uint32_t seed = seed_ + attempt;
    LOG_IF(INFO, init_mode == kRandomInit) << "Attempt " << attempt + 1
      << " with seed " << seed;
    ProbTableInitializer initializer(init_mode, seed);
    EMEngine engine(counts, &initializer);
    result = engine.Fit(K_, max_iterations_, epsilon_);
    if (!result.failed()) {
      break;
    }
    LOG_IF(INFO, attempt < num_restarts_) << "Restarting after failure";
  }
  return result;
}

void PLSAApp::PrintTopWords(const Matrix& phi) const {
  const Vocabulary& vocab = corpus_.GetVocabulary();
  for (size_t k = 0; k < phi.size(); ++k) {
    std::stringstream ss;
    for (int32_t w : TopN(phi[k], num_top_words_)) {
      ss << vocab[w] << ":" << phi[k][w] << " ";
    }
    LOG(INFO) << "topic " << k << ": " << ss.str();
  }
}

void PLSAApp::PrintDocTopics(const Matrix& theta) const {
  if (theta.empty() || theta[0].empty()) {
    return;
  }
  std::vector<int32_t> topic_sizes(theta[0].size(), 0);
  for (size_t d = 0; d < theta.size(); ++d) {
    int32_t topic = ArgMax(theta[d]);
    ++topic_sizes[topic];
    VLOG(1) << "doc " << d << ": topic " << topic << " ("
      << theta[d][topic] << ")";
  }
  LOG(INFO) << "Documents per most probable topic: "
    << VectorToString(topic_sizes);
}

void PLSAApp::SaveLLH(const std::vector<double>& llh) const {
  if (output_file_prefix_.empty()) {
    return;
  }
  PLSAStats stats;
  for (double val : llh) {
    stats.AppendLLH(val);
  }
  HighResolutionTimer disk_output_timer;
  std::string output_file = output_file_prefix_ + ".llh";
  std::ofstream out_stream(output_file.c_str());
  CHECK(out_stream) << "Failed to open output_file " << output_file;
  out_stream << stats.PrintLLH();
  out_stream.close();
  LOG(INFO) << "LLH 1 ~ " << stats.GetNumLLH() << " is saved to "
    << output_file << " in " << disk_output_timer.elapsed() << " sec.";
}

}   // namespace plsa
