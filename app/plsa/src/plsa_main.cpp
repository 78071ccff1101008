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
#include <gflags/gflags.h>
#include <glog/logging.h>

// Input
DEFINE_string(doc_file, "",
    "Text file with one document per line; tokens separated by whitespace.");

// PLSA Parameters
DEFINE_int32(num_topics, 2, "Number of topics.");
DEFINE_int32(max_iterations, 50, "Maximum number of EM iterations.");
DEFINE_double(epsilon, 0.001, "Stop once the log2-likelihood changes by less "
    "than epsilon between two consecutive iterations.");
DEFINE_string(init_mode, "random", "Initialization of P(z|d) and P(w|z): "
    "'random' or 'uniform'. Uniform is a fixed point of EM and only useful "
    "for testing.");
DEFINE_int32(seed, -1, "Seed for random initialization. -1 uses the time.");
DEFINE_int32(num_restarts, 0, "Number of re-initialized restarts after a "
    "failed fitting run.");

// Output
DEFINE_int32(num_top_words, 10, "Number of top words logged per topic.");
DEFINE_string(output_file_prefix, "", "If set, the log-likelihood trace is "
    "written to output_file_prefix.llh");

int main(int argc, char *argv[]) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_doc_file.empty()) {
    LOG(ERROR) << "--doc_file is required";
    return 1;
  }

  plsa::PLSAApp plsa_app;
  int status = plsa_app.Run();
  LOG(INFO) << "PLSA finished!";
  return status;
}
