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
#include <cstdint>
#include <vector>

namespace plsa {

// Dense D x V matrix of term occurrence counts. Row d is document d, column
// w is vocabulary term w. Read-only once built.
class TermDocMatrix {
public:
  TermDocMatrix();

  // Counts every token of every document against the vocabulary. Tokens
  // missing from the vocabulary are ignored. An empty vocabulary gives a
  // D x 0 matrix.
  TermDocMatrix(const std::vector<Document>& docs, const Vocabulary& vocab);

  int32_t num_docs() const { return num_docs_; }

  int32_t vocab_size() const { return vocab_size_; }

  int32_t operator()(int32_t doc_id, int32_t word_id) const {
    return counts_[doc_id][word_id];
  }

  const std::vector<int32_t>& Row(int32_t doc_id) const {
    return counts_[doc_id];
  }

  // Number of counted tokens in document 'doc_id'.
  int64_t GetDocLength(int32_t doc_id) const;

  int64_t GetTotalCount() const;

private:
  int32_t num_docs_;
  int32_t vocab_size_;
  std::vector<std::vector<int32_t> > counts_;
};

}  // namespace plsa
