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

/*
 * Splits page text into whitespace delimited words. char_boxes holds one
 * box per UTF-8 character of text, as a PDF text layout reports them. A
 * word's box is the union of its characters' boxes. Characters without a
 * box still go into the word text.
 */
std::vector<Word> words_from_layout(std::string_view text, const std::vector<BBox> &char_boxes);

BBox bbox_union(const BBox &a, const BBox &b);

std::string current_date();

// Output name for raster report page number page_num (starting from 1).
std::string numbered_png_name(const std::string &ofname, int page_num);
