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

#include <plsa/model/em_engine.hpp>
#include <plsa/util/high_resolution_timer.hpp>
#include <plsa/util/math_util.hpp>
#include <plsa/util/plsa_error.hpp>
#include <glog/logging.h>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace plsa {

namespace {

// Normalizes 'm' and tags a failure with the table being re-estimated.
void NormalizeTable(const std::string& table_name, Matrix* m) {
  try {
    RowNormalize(m);
  } catch (const PLSAError& e) {
    throw PLSAError(e.code(), "M-step " + table_name + ": " + e.what(),
        e.doc_id(), e.word_id());
  }
}

}  // anonymous namespace

EMEngine::EMEngine(const TermDocMatrix& counts,
    ProbTableInitializer* initializer) :
    counts_(counts), initializer_(initializer) {
  CHECK_NOTNULL(initializer_);
}

FitResult EMEngine::Fit(int32_t num_topics, int32_t max_iterations,
    double epsilon) {
  CheckArguments(num_topics, max_iterations, epsilon);

  HighResolutionTimer total_timer;
  FitSession session;
  FitResult result;
  try {
    LOG(INFO) << "Initializing " << InitModeName(initializer_->mode())
      << " tables with " << num_topics << " topics";
    Initialize(num_topics, &session);

    LOG(INFO) << "EM iteration begins: max_iterations = " << max_iterations
      << ", epsilon = " << epsilon;
    session.state = kIterating;
    total_timer.Lap();
    for (int32_t iter = 0; iter < max_iterations; ++iter) {
      EStep(&session);
      MStep(&session);
      double llh = UpdateLLH(&session);

      std::stringstream delta;
      if (iter > 0) {
        delta << "\tchange: "
          << std::fabs(llh - session.stats.GetLLH(iter - 1));
      }
      LOG(INFO) << "iter: " << iter + 1
        << "\tllh: " << llh << delta.str()
        << "\ttook: " << total_timer.Lap() << " sec";

      if (IsConverged(session.stats.GetLLHTrace(), epsilon)) {
        session.state = kConverged;
        break;
      }
    }
    if (session.state == kIterating) {
      session.state = kBudgetExhausted;
    }
  } catch (PLSAError& e) {
    if (session.state == kIterating) {
      // The failing iteration is the one after the last completed one.
      e.set_iteration(session.stats.GetNumLLH());
    }
    session.state = kFailed;
    result.error_code = e.code();
    result.error_message = e.DebugString();
    LOG(ERROR) << "Fitting failed: " << result.error_message;
  }

  result.terminal_state = session.state;
  result.num_iterations = session.stats.GetNumLLH();
  result.llh = session.stats.GetLLHTrace();
  if (!result.failed()) {
    result.theta = std::move(session.theta);
    result.phi = std::move(session.phi);
  }
  result.seconds = total_timer.elapsed();
  LOG(INFO) << "Fit finished in state " << FitStateName(result.terminal_state)
    << " after " << result.num_iterations << " iterations, "
    << result.seconds << " sec";
  return result;
}

void EMEngine::Initialize(int32_t num_topics, FitSession* session) {
  CHECK_NOTNULL(session);
  CHECK_LT(0, num_topics);
  int32_t num_docs = counts_.num_docs();
  int32_t vocab_size = counts_.vocab_size();
  session->num_topics = num_topics;
  initializer_->Init(num_docs, num_topics, vocab_size, &session->theta,
      &session->phi);
  session->z.assign(num_docs, MakeMatrix(num_topics, vocab_size, 0.));
  session->state = kInitialized;
}

void EMEngine::EStep(FitSession* session) const {
  CHECK_NOTNULL(session);
  CheckShapes(*session);
  VLOG(1) << "E step";
  int32_t num_docs = counts_.num_docs();
  int32_t vocab_size = counts_.vocab_size();
  int32_t num_topics = session->num_topics;
  const Matrix& theta = session->theta;
  const Matrix& phi = session->phi;
  Tensor& z = session->z;
  if (!HasPosteriorShape(*session)) {
    z.assign(num_docs, MakeMatrix(num_topics, vocab_size, 0.));
  }

  std::vector<double> topic_prob(num_topics);
  for (int32_t d = 0; d < num_docs; ++d) {
    for (int32_t w = 0; w < vocab_size; ++w) {
      double sum = 0.;
      for (int32_t k = 0; k < num_topics; ++k) {
        topic_prob[k] = theta[d][k] * phi[k][w];
        sum += topic_prob[k];
      }
      if (sum == 0.) {
        std::stringstream ss;
        ss << "All topics give zero mass to doc " << d << " and word " << w;
        throw PLSAError(kDegenerateEStep, ss.str(), d, w);
      }
      for (int32_t k = 0; k < num_topics; ++k) {
        z[d][k][w] = topic_prob[k] / sum;
      }
    }
  }
}

void EMEngine::MStep(FitSession* session) const {
  CHECK_NOTNULL(session);
  CheckShapes(*session);
  VLOG(1) << "M step";
  int32_t num_docs = counts_.num_docs();
  int32_t vocab_size = counts_.vocab_size();
  int32_t num_topics = session->num_topics;
  const Tensor& z = session->z;
  CHECK(HasPosteriorShape(*session))
    << "z is not " << num_docs << " x " << num_topics << " x " << vocab_size
    << "; run the E-step first";

  // P(w | z)
  Matrix phi = MakeMatrix(num_topics, vocab_size, 0.);
  for (int32_t k = 0; k < num_topics; ++k) {
    for (int32_t w = 0; w < vocab_size; ++w) {
      double acc = 0.;
      for (int32_t d = 0; d < num_docs; ++d) {
        acc += counts_(d, w) * z[d][k][w];
      }
      phi[k][w] = acc;
    }
  }
  NormalizeTable("topic-word table", &phi);

  // P(z | d), from the same z.
  Matrix theta = MakeMatrix(num_docs, num_topics, 0.);
  for (int32_t d = 0; d < num_docs; ++d) {
    for (int32_t k = 0; k < num_topics; ++k) {
      double acc = 0.;
      for (int32_t w = 0; w < vocab_size; ++w) {
        acc += counts_(d, w) * z[d][k][w];
      }
      theta[d][k] = acc;
    }
  }
  NormalizeTable("doc-topic table", &theta);

  session->phi.swap(phi);
  session->theta.swap(theta);
}

double EMEngine::UpdateLLH(FitSession* session) const {
  CHECK_NOTNULL(session);
  CheckShapes(*session);
  double llh = PLSAStats::ComputeLLH(counts_, session->theta, session->phi);
  session->stats.AppendLLH(llh);
  return llh;
}

bool EMEngine::IsConverged(const std::vector<double>& llh, double epsilon) {
  if (llh.size() < 2) {
    return false;
  }
  double change = std::fabs(llh[llh.size() - 1] - llh[llh.size() - 2]);
  return change < epsilon || change == 0.;
}

void EMEngine::CheckArguments(int32_t num_topics, int32_t max_iterations,
    double epsilon) const {
  std::stringstream ss;
  if (num_topics < 1) {
    ss << "num_topics must be >= 1, got " << num_topics;
  } else if (max_iterations < 1) {
    ss << "max_iterations must be >= 1, got " << max_iterations;
  } else if (!(epsilon >= 0.)) {
    ss << "epsilon must be >= 0, got " << epsilon;
  } else {
    return;
  }
  throw PLSAError(kInvalidArgument, ss.str());
}

void EMEngine::CheckShapes(const FitSession& session) const {
  int32_t num_topics = session.num_topics;
  CHECK_EQ(counts_.num_docs(), static_cast<int32_t>(session.theta.size()));
  for (const auto& row : session.theta) {
    CHECK_EQ(num_topics, static_cast<int32_t>(row.size()));
  }
  CHECK_EQ(num_topics, static_cast<int32_t>(session.phi.size()));
  for (const auto& row : session.phi) {
    CHECK_EQ(counts_.vocab_size(), static_cast<int32_t>(row.size()));
  }
}

bool EMEngine::HasPosteriorShape(const FitSession& session) const {
  const Tensor& z = session.z;
  if (z.size() != static_cast<size_t>(counts_.num_docs())) {
    return false;
  }
  for (const Matrix& doc : z) {
    if (doc.size() != static_cast<size_t>(session.num_topics)) {
      return false;
    }
    for (const auto& topic_row : doc) {
      if (topic_row.size() != static_cast<size_t>(counts_.vocab_size())) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace plsa
