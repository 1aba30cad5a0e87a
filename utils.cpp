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

#include <utils.hpp>
#include <glib.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <time.h>

std::vector<Word> words_from_layout(std::string_view text, const std::vector<BBox> &char_boxes) {
    if(!g_utf8_validate(text.data(), text.size(), nullptr)) {
        throw std::runtime_error("Page text is not valid UTF-8.");
    }
    std::vector<Word> words;
    Word current;
    bool has_box = false;
    auto flush = [&]() {
        if(!current.text.empty()) {
            words.emplace_back(std::move(current));
        }
        current = Word{};
        has_box = false;
    };

    const char *p = text.data();
    const char *end = text.data() + text.size();
    size_t char_index = 0;
    while(p < end) {
        const char *next = g_utf8_next_char(p);
        const gunichar c = g_utf8_get_char(p);
        if(g_unichar_isspace(c)) {
            flush();
        } else {
            current.text.append(p, next - p);
            if(char_index < char_boxes.size()) {
                const auto &box = char_boxes[char_index];
                current.bbox = has_box ? bbox_union(current.bbox, box) : box;
                has_box = true;
            }
        }
        p = next;
        ++char_index;
    }
    flush();
    return words;
}

BBox bbox_union(const BBox &a, const BBox &b) {
    return BBox{std::min(a.x0, b.x0), std::min(a.y0, b.y0), std::max(a.x1, b.x1), std::max(a.y1, b.y1)};
}

std::string current_date() {
    char buf[200];
    time_t t;
    struct tm *tmp;
    t = time(NULL);
    tmp = localtime(&t);
    if(tmp == NULL) {
        throw std::runtime_error("Could not determine local time.");
    }

    if(strftime(buf, 200, "%Y-%m-%d", tmp) == 0) {
        throw std::runtime_error("Could not format date.");
    }
    return std::string{buf};
}

std::string numbered_png_name(const std::string &ofname, int page_num) {
    std::filesystem::path p(ofname);
    if(p.extension() == ".png" || p.extension() == ".PNG") {
        p.replace_extension();
    }
    char suffix[32];
    snprintf(suffix, sizeof(suffix), "-%03d.png", page_num);
    return p.string() + suffix;
}
