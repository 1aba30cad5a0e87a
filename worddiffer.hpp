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

#pragma once

#include <diffcommon.hpp>

#include <string>
#include <vector>

// Edit script over the word texts. Bounding boxes are carried, not compared.
std::vector<WordDiffOp> diff_words(const std::vector<Word> &words_a,
                                   const std::vector<Word> &words_b);

std::vector<std::string> word_texts(const std::vector<Word> &words);
