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

#include "config.h"

#include <algorithm>
#include <unordered_set>
#include <vector>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/id.h"

using evt::Id;

void unit_test_id_basic()
{
    TEST_CASE(test::Type::Feature)

    Id invalid;
    TEST_REQUIRE(!invalid.IsValid());
    TEST_REQUIRE(!invalid.IsRoot());
    TEST_REQUIRE(invalid.ToString() == "#INVALID");
    TEST_REQUIRE(!invalid.MakeChild(0).IsValid());
    TEST_REQUIRE(!invalid.GetParent().has_value());

    const auto root = Id::Root();
    TEST_REQUIRE(root.IsValid());
    TEST_REQUIRE(root.IsRoot());
    TEST_REQUIRE(root.ToString() == "#");
    TEST_REQUIRE(!root.GetParent().has_value());

    const auto a = root.MakeChild(1);
    const auto b = a.MakeChild(3);
    TEST_REQUIRE(b.ToString() == "#1.3");
    TEST_REQUIRE(b.GetPathLength() == 2);
    TEST_REQUIRE(b == Id::FromPath({1, 3}));
    TEST_REQUIRE(b != Id::FromPath({1, 2}));
    TEST_REQUIRE(b.GetParent().value() == a);
    TEST_REQUIRE(a.GetParent().value() == root);
}

void unit_test_id_ancestry()
{
    TEST_CASE(test::Type::Feature)

    const auto root = Id::Root();
    const auto a  = Id::FromPath({0});
    const auto ab = Id::FromPath({0, 1});
    const auto c  = Id::FromPath({2});

    TEST_REQUIRE(root.IsAncestorOf(a));
    TEST_REQUIRE(root.IsAncestorOf(ab));
    TEST_REQUIRE(a.IsAncestorOf(ab));
    TEST_REQUIRE(a.IsAncestorOf(a));
    TEST_REQUIRE(!ab.IsAncestorOf(a));
    TEST_REQUIRE(!c.IsAncestorOf(ab));
    TEST_REQUIRE(!Id().IsAncestorOf(a));
    TEST_REQUIRE(!a.IsAncestorOf(Id()));

    TEST_REQUIRE(evt::IsAncestorOf(std::optional<Id>(a), ab));
    TEST_REQUIRE(!evt::IsAncestorOf(std::nullopt, ab));

    // the common ancestor is an ancestor of both and idempotent.
    const std::vector<Id> ids = {
        root, a, ab, c, Id::FromPath({0, 1, 5}), Id::FromPath({0, 2}), Id::FromPath({2, 0, 0})
    };
    for (const auto& lhs : ids)
    {
        for (const auto& rhs : ids)
        {
            const auto common = lhs.CommonAncestor(rhs);
            TEST_REQUIRE(common.IsAncestorOf(lhs));
            TEST_REQUIRE(common.IsAncestorOf(rhs));
            TEST_REQUIRE(common.CommonAncestor(common) == common);
            TEST_REQUIRE(common.CommonAncestor(lhs) == common);
            TEST_REQUIRE(rhs.CommonAncestor(lhs) == common);
        }
    }
    TEST_REQUIRE(ab.CommonAncestor(Id::FromPath({0, 2})) == a);
    TEST_REQUIRE(ab.CommonAncestor(c) == root);
    TEST_REQUIRE(!ab.CommonAncestor(Id()).IsValid());
}

void unit_test_id_keys()
{
    TEST_CASE(test::Type::Feature)

    const auto id = Id::FromPath({4, 7, 9});
    TEST_REQUIRE(id.IterKeysAfter(Id::FromPath({4})) == std::vector<std::size_t>({7, 9}));
    TEST_REQUIRE(id.IterKeysAfter(Id::Root()) == std::vector<std::size_t>({4, 7, 9}));
    TEST_REQUIRE(id.IterKeysAfter(id).empty());
    TEST_REQUIRE(id.IterKeysAfter(Id::FromPath({5})).empty());

    TEST_REQUIRE(id.NextKeyAfter(Id::FromPath({4})).value() == 7);
    TEST_REQUIRE(id.NextKeyAfter(Id::Root()).value() == 4);
    TEST_REQUIRE(!id.NextKeyAfter(id).has_value());
    TEST_REQUIRE(!id.NextKeyAfter(Id::FromPath({3})).has_value());
}

void unit_test_id_order()
{
    TEST_CASE(test::Type::Feature)

    // ordering is the pre-order traversal of the tree.
    std::vector<Id> ids = {
        Id::FromPath({1}),
        Id::FromPath({0, 1}),
        Id::Root(),
        Id::FromPath({0}),
        Id(),
        Id::FromPath({0, 0, 3}),
        Id::FromPath({0, 0}),
    };
    std::sort(ids.begin(), ids.end());
    TEST_REQUIRE(!ids[0].IsValid());
    TEST_REQUIRE(ids[1] == Id::Root());
    TEST_REQUIRE(ids[2] == Id::FromPath({0}));
    TEST_REQUIRE(ids[3] == Id::FromPath({0, 0}));
    TEST_REQUIRE(ids[4] == Id::FromPath({0, 0, 3}));
    TEST_REQUIRE(ids[5] == Id::FromPath({0, 1}));
    TEST_REQUIRE(ids[6] == Id::FromPath({1}));

    TEST_REQUIRE(Id::FromPath({0}) < Id::FromPath({0, 0}));
    TEST_REQUIRE(Id::FromPath({0, 5}) < Id::FromPath({1}));
    TEST_REQUIRE(Id::FromPath({1}) > Id::FromPath({0, 5}));
    TEST_REQUIRE(Id::FromPath({1}) >= Id::FromPath({1}));
    TEST_REQUIRE(Id::FromPath({1}) <= Id::FromPath({1}));
}

void unit_test_id_hash()
{
    TEST_CASE(test::Type::Feature)

    std::unordered_set<Id> set;
    set.insert(Id::FromPath({1, 2}));
    set.insert(Id::FromPath({1, 2}));
    set.insert(Id::Root());
    set.insert(Id());
    TEST_REQUIRE(set.size() == 3);
    TEST_REQUIRE(set.count(Id::Root().MakeChild(1).MakeChild(2)) == 1);
    TEST_REQUIRE(Id::FromPath({1, 2}).GetHash() == Id::FromPath({1, 2}).GetHash());
    // an invalid id and the root have the same (empty) path.
    TEST_REQUIRE(Id() != Id::Root());
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_id.log");

    unit_test_id_basic();
    unit_test_id_ancestry();
    unit_test_id_keys();
    unit_test_id_order();
    unit_test_id_hash();
    return 0;
}
) // TEST_MAIN
