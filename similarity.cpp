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

#include <similarity.hpp>
#include <sequencematcher.hpp>

#include <glib.h>

#include <memory>
#include <stdexcept>

namespace {

struct GFreeDeleter {
    void operator()(gunichar *p) const noexcept { g_free(p); }
};

typedef std::unique_ptr<gunichar, GFreeDeleter> UcsBuffer;

struct CodePoints {
    UcsBuffer buf;
    glong len = 0;

    std::span<const gunichar> view() const {
        return std::span<const gunichar>(buf.get(), size_t(len));
    }
};

CodePoints decode_utf8(std::string_view text) {
    CodePoints cp;
    if(text.empty()) {
        return cp;
    }
    if(!g_utf8_validate(text.data(), gssize(text.size()), nullptr)) {
        throw std::runtime_error("Page text is not valid UTF-8.");
    }
    cp.buf.reset(g_utf8_to_ucs4_fast(text.data(), glong(text.size()), &cp.len));
    return cp;
}

} // namespace

double similarity_ratio(std::string_view a, std::string_view b, bool autojunk) {
    if(a == b) {
        return 1.0;
    }
    const auto cp_a = decode_utf8(a);
    const auto cp_b = decode_utf8(b);
    SequenceMatcher<gunichar> m(cp_a.view(), cp_b.view(), autojunk);
    return m.ratio();
}

double similarity_ratio(const std::vector<std::string> &a,
                        const std::vector<std::string> &b,
                        bool autojunk) {
    if(a == b) {
        return 1.0;
    }
    SequenceMatcher<std::string> m(a, b, autojunk);
    return m.ratio();
}
