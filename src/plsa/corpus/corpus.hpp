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
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace plsa {

// Corpus reads raw text, one document per line with whitespace separated
// tokens, and builds the vocabulary as the unique tokens in order of first
// occurrence. Document d is input line d (0-based); a line without tokens
// becomes an empty document. Documents and vocabulary are not modified
// after loading.
class Corpus {
public:
  Corpus();

  // Replaces any previously loaded content. Dies if the file can't be
  // opened.
  void ReadFile(const std::string& doc_file);

  void Read(std::istream& in);

  const std::vector<Document>& GetDocuments() const { return docs_; }

  const Vocabulary& GetVocabulary() const { return vocab_; }

  int32_t GetNumDocs() const { return docs_.size(); }

  int32_t GetVocabSize() const { return vocab_.size(); }

  int64_t GetNumTokens() const { return num_tokens_; }

  // Number of documents without any token. Such a document has no mass to
  // estimate its topic mixture from, so fitting the corpus fails.
  int32_t GetNumEmptyDocs() const { return num_empty_docs_; }

  // Column index of 'term', or -1 if it is not in the vocabulary.
  int32_t GetWordId(const std::string& term) const;

private:
  void Clear();

  void BuildVocabulary();

private:
  std::vector<Document> docs_;

  Vocabulary vocab_;

  // term --> column index in vocab_.
  std::unordered_map<std::string, int32_t> word_ids_;

  int64_t num_tokens_;

  int32_t num_empty_docs_;
};

}  // namespace plsa
