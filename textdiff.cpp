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

#include <textdiff.hpp>
#include <sequencematcher.hpp>

namespace {

std::string join_pages(const std::vector<PageText> &pages) {
    std::string full;
    for(size_t i = 0; i < pages.size(); ++i) {
        if(i > 0) {
            full += '\n';
        }
        full += pages[i].content;
    }
    return full;
}

} // namespace

std::vector<std::string> split_text_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::string current;
    size_t i = 0;
    while(i < text.size()) {
        const char c = text[i];
        if(c == '\n' || c == '\r' || c == '\f') {
            lines.emplace_back(std::move(current));
            current.clear();
            if(c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current.push_back(c);
        }
        ++i;
    }
    if(!current.empty()) {
        lines.emplace_back(std::move(current));
    }
    return lines;
}

std::string format_unified_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    const size_t length = stop - start;
    if(length == 1) {
        return std::to_string(beginning);
    }
    if(length == 0) {
        --beginning;
    }
    return std::to_string(beginning) + "," + std::to_string(length);
}

std::vector<std::string> unified_text_diff(const std::vector<PageText> &text_a,
                                           const std::vector<PageText> &text_b,
                                           size_t context) {
    const auto lines_a = split_text_lines(join_pages(text_a));
    const auto lines_b = split_text_lines(join_pages(text_b));
    SequenceMatcher<std::string> matcher(lines_a, lines_b);

    std::vector<std::string> out;
    for(const auto &group : matcher.grouped_opcodes(context)) {
        if(out.empty()) {
            out.emplace_back("--- PDF A");
            out.emplace_back("+++ PDF B");
        }
        const auto &first = group.front();
        const auto &last = group.back();
        std::string header{"@@ -"};
        header += format_unified_range(first.i1, last.i2);
        header += " +";
        header += format_unified_range(first.j1, last.j2);
        header += " @@";
        out.emplace_back(std::move(header));
        for(const auto &op : group) {
            if(op.tag == DiffTag::Equal) {
                for(size_t i = op.i1; i < op.i2; ++i) {
                    out.emplace_back(" " + lines_a[i]);
                }
                continue;
            }
            if(op.tag == DiffTag::Replace || op.tag == DiffTag::Delete) {
                for(size_t i = op.i1; i < op.i2; ++i) {
                    out.emplace_back("-" + lines_a[i]);
                }
            }
            if(op.tag == DiffTag::Replace || op.tag == DiffTag::Insert) {
                for(size_t j = op.j1; j < op.j2; ++j) {
                    out.emplace_back("+" + lines_b[j]);
                }
            }
        }
    }
    return out;
}
