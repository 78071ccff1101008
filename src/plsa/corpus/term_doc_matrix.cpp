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

#include <plsa/corpus/term_doc_matrix.hpp>
#include <glog/logging.h>
#include <string>
#include <unordered_map>
#include <utility>

namespace plsa {

TermDocMatrix::TermDocMatrix() : num_docs_(0), vocab_size_(0) { }

TermDocMatrix::TermDocMatrix(const std::vector<Document>& docs,
    const Vocabulary& vocab) :
    num_docs_(docs.size()),
    vocab_size_(vocab.size()),
    counts_(docs.size(), std::vector<int32_t>(vocab.size(), 0)) {
  std::unordered_map<std::string, int32_t> word_ids;
  for (int32_t w = 0; w < vocab_size_; ++w) {
    CHECK(word_ids.insert(std::make_pair(vocab[w], w)).second)
      << "Duplicate vocabulary term " << vocab[w];
  }
  for (int32_t d = 0; d < num_docs_; ++d) {
    std::vector<int32_t>& row = counts_[d];
    for (const std::string& term : docs[d]) {
      auto it = word_ids.find(term);
      if (it != word_ids.end()) {
        ++row[it->second];
      }
    }
  }
}

int64_t TermDocMatrix::GetDocLength(int32_t doc_id) const {
  CHECK_LE(0, doc_id);
  CHECK_LT(doc_id, num_docs_);
  int64_t length = 0;
  for (int32_t count : counts_[doc_id]) {
    length += count;
  }
  return length;
}

int64_t TermDocMatrix::GetTotalCount() const {
  int64_t total = 0;
  for (int32_t d = 0; d < num_docs_; ++d) {
    total += GetDocLength(d);
  }
  return total;
}

}  // namespace plsa
