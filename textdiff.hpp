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
#include <string_view>
#include <vector>

// Line split that keeps empty lines and drops the final terminator.
// Breaks on \n, \r\n, \r and form feed.
std::vector<std::string> split_text_lines(std::string_view text);

// "@@" range as unified diff writes it: 1-based start, length omitted if 1.
std::string format_unified_range(size_t start, size_t stop);

/*
 * Unified diff of the whole text of both documents, pages joined with
 * newlines. Returns no lines at all if the texts are identical.
 */
std::vector<std::string> unified_text_diff(const std::vector<PageText> &text_a,
                                           const std::vector<PageText> &text_b,
                                           size_t context = 3);
