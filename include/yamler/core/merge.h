// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <yamler/core/Node.h>
#include <yamler/support/logging.h>

namespace yamler {

/// Replace the content of base with a copy of donor.  Comments already on
/// base are kept, the donor's comments only fill empty slots.
inline
void replace_from(Node& base, const Node& donor) {
    Node replacement = donor.clone_detached();
    Node comments;
    comments.copy_comments_from(replacement);
    base.replace_with(std::move(replacement));
    base.copy_missing_comments_from(comments);
}

//////////////////////////////////////////////////////////////////////////////
/// @brief Merge donor into base, in place.
/// Mappings merge per key: keys found only in the donor are appended after
/// the existing keys, in donor order, and shared keys merge recursively.  In
/// every other case (including sequence over sequence) the donor value
/// replaces the base value.
//////////////////////////////////////////////////////////////////////////////
inline
void merge(Node& base, const Node& donor) {
    if (!(base.is_mapping() && donor.is_mapping())) {
        replace_from(base, donor);
        return;
    }

    for (size_t i = 0; i < donor.size(); ++i) {
        auto& donor_key = donor.key_at(i);
        auto& donor_value = donor.value_at(i);
        auto entry = base.find_entry(donor_key.value);
        if (entry != std::string::npos) {
            base.key_at(entry).copy_missing_comments_from(donor_key.clone_detached());
            merge(base.value_at(entry), donor_value);
        } else {
            YAMLER_DEBUG("merge: adding key {}", donor_key.value);
            base.add_entry(donor_key.value, donor_value.clone_detached());
            auto& key = base.key_at(base.size() - 1);
            key.copy_comments_from(donor_key.clone_detached());
            key.scalar_style = donor_key.scalar_style;
        }
    }
}

} // namespace yamler
