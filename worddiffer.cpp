/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <worddiffer.hpp>
#include <sequencematcher.hpp>

#include <cassert>

std::vector<std::string> word_texts(const std::vector<Word> &words) {
    std::vector<std::string> texts;
    texts.reserve(words.size());
    for(const auto &w : words) {
        texts.push_back(w.text);
    }
    return texts;
}

std::vector<WordDiffOp> diff_words(const std::vector<Word> &words_a,
                                   const std::vector<Word> &words_b) {
    const auto texts_a = word_texts(words_a);
    const auto texts_b = word_texts(words_b);
    SequenceMatcher<std::string> matcher(texts_a, texts_b);
    auto ops = matcher.opcodes();
    assert(ops_cover(ops, words_a.size(), words_b.size()));
    return ops;
}
