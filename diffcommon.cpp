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

#include <diffcommon.hpp>

#include <cstdlib>

const char *tag_name(DiffTag tag) {
    switch(tag) {
    case DiffTag::Equal:
        return "equal";
    case DiffTag::Replace:
        return "replace";
    case DiffTag::Insert:
        return "insert";
    case DiffTag::Delete:
        return "delete";
    }
    std::abort();
}

bool ops_cover(const std::vector<EditOp> &ops, size_t len_a, size_t len_b) {
    size_t next_a = 0;
    size_t next_b = 0;
    for(const auto &op : ops) {
        if(op.i1 != next_a || op.j1 != next_b) {
            return false;
        }
        if(op.i2 < op.i1 || op.j2 < op.j1) {
            return false;
        }
        switch(op.tag) {
        case DiffTag::Equal:
        case DiffTag::Replace:
            if(op.a_len() == 0 || op.b_len() == 0) {
                return false;
            }
            break;
        case DiffTag::Insert:
            if(op.a_len() != 0 || op.b_len() == 0) {
                return false;
            }
            break;
        case DiffTag::Delete:
            if(op.a_len() == 0 || op.b_len() != 0) {
                return false;
            }
            break;
        }
        next_a = op.i2;
        next_b = op.j2;
    }
    return next_a == len_a && next_b == len_b;
}
