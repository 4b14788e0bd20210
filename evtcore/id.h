// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace evt
{
    // Id is a structural path identifying a node in the widget tree.
    // Each Id is the sequence of child indices taken from the root of
    // the tree to the node. Ids are plain values and are only stable
    // between two configure passes over the tree.
    //
    // Ids are totally ordered. The ordering is lexicographic over the
    // path which equals the pre-order traversal of the tree, i.e. a
    // parent is ordered before its children and a child subtree is
    // ordered before its next sibling. An invalid Id orders before
    // any valid Id.
    class Id
    {
    public:
        // Construct an invalid Id. Invalid Ids fail all structural
        // tests and never identify a node.
        Id() = default;

        // Get the root Id. The root is a prefix of every valid Id.
        static Id Root();

        // Construct an Id from an explicit path. Mostly useful for testing.
        static Id FromPath(std::vector<std::size_t> path);

        inline bool IsValid() const noexcept
        { return mValid; }
        inline bool IsRoot() const noexcept
        { return mValid && mPath.empty(); }

        // Make the Id of the child at the given index.
        Id MakeChild(std::size_t index) const;

        // Returns true if this Id is an ancestor of the other Id or
        // equal to it. Returns false if either Id is invalid.
        bool IsAncestorOf(const Id& other) const noexcept;

        // Get the longest common prefix of this and the other Id.
        // The result is an ancestor of both. If either Id is invalid
        // the result is invalid.
        Id CommonAncestor(const Id& other) const;

        // Get the Id of the parent node if any. The root has no parent.
        std::optional<Id> GetParent() const;

        // Get the child index keys of this Id that follow the given
        // ancestor. If the ancestor is not actually an ancestor of
        // this Id the result is empty.
        std::vector<std::size_t> IterKeysAfter(const Id& ancestor) const;

        // Get the next key (child index) after the given ancestor
        // when this Id is a strict descendant of the ancestor.
        std::optional<std::size_t> NextKeyAfter(const Id& ancestor) const;

        // Get the number of steps from the root to this node.
        inline std::size_t GetPathLength() const noexcept
        { return mPath.size(); }
        inline const std::vector<std::size_t>& GetPath() const noexcept
        { return mPath; }

        std::size_t GetHash() const noexcept;

        // Render the Id in a human readable form, for example #0.1.3
        std::string ToString() const;

        bool operator==(const Id& other) const noexcept
        { return mValid == other.mValid && mPath == other.mPath; }
        bool operator!=(const Id& other) const noexcept
        { return !(*this == other); }
        bool operator<(const Id& other) const noexcept;
        bool operator>(const Id& other) const noexcept
        { return other < *this; }
        bool operator<=(const Id& other) const noexcept
        { return !(other < *this); }
        bool operator>=(const Id& other) const noexcept
        { return !(*this < other); }
    private:
        std::vector<std::size_t> mPath;
        bool mValid = false;
    };

    // Test whether the optional Id is an ancestor of (or equal to) the
    // other Id. Empty optional matches nothing.
    inline bool IsAncestorOf(const std::optional<Id>& maybe, const Id& id) noexcept
    { return maybe.has_value() && maybe->IsAncestorOf(id); }

    inline std::string ToString(const Id& id)
    { return id.ToString(); }

} // namespace

namespace std {
template<> struct hash<evt::Id> {
    std::size_t operator()(const evt::Id& id) const noexcept
    { return id.GetHash(); }
};
} // namespace std
