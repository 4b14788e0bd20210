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

#include <string>

#include "base/test_minimal.h"
#include "base/test_help.h"
#include "evtcore/message.h"

void unit_test_erased()
{
    TEST_CASE(test::Type::Feature)

    evt::Erased msg(std::string("hello"));
    TEST_REQUIRE(msg.Is<std::string>());
    TEST_REQUIRE(!msg.Is<int>());
    TEST_REQUIRE(msg.Get<int>() == nullptr);
    TEST_REQUIRE(*msg.Get<std::string>() == "hello");
    TEST_REQUIRE(!msg.Take<int>().has_value());
    TEST_REQUIRE(!msg.IsEmpty());

    auto value = msg.Take<std::string>();
    TEST_REQUIRE(value.value() == "hello");
    TEST_REQUIRE(msg.IsEmpty());
    TEST_REQUIRE(!msg.Is<std::string>());

    TEST_REQUIRE(evt::IsSafeToIgnore(evt::Erased(evt::msg::KineticStart {})));
    TEST_REQUIRE(!evt::IsSafeToIgnore(evt::Erased(evt::msg::Select {})));
}

void unit_test_stack_push_pop()
{
    TEST_CASE(test::Type::Feature)

    evt::MessageStack stack;
    TEST_REQUIRE(!stack.HasAny());
    TEST_REQUIRE(!stack.TryPop<int>().has_value());

    stack.Push(1);
    stack.Push(std::string("two"));
    TEST_REQUIRE(stack.HasAny());
    TEST_REQUIRE(stack.GetSize() == 2);
    TEST_REQUIRE(stack.GetOpCount() == 2);

    // only the top message can be popped
    TEST_REQUIRE(!stack.TryPop<int>().has_value());
    TEST_REQUIRE(stack.TryPeek<int>() == nullptr);
    TEST_REQUIRE(*stack.TryPeek<std::string>() == "two");
    TEST_REQUIRE(*stack.TryObserve<std::string>() == "two");
    TEST_REQUIRE(stack.TryObserve<int>() == nullptr);
    TEST_REQUIRE(stack.TryPop<std::string>().value() == "two");
    TEST_REQUIRE(stack.TryPop<int>().value() == 1);
    TEST_REQUIRE(!stack.HasAny());
    TEST_REQUIRE(stack.GetOpCount() == 4);

    stack.Push(evt::msg::SetIndex { 5 });
    auto erased = stack.PopErased();
    TEST_REQUIRE(erased.has_value());
    TEST_REQUIRE(erased->Get<evt::msg::SetIndex>()->index == 5);
    TEST_REQUIRE(!stack.PopErased().has_value());
}

void unit_test_stack_base()
{
    TEST_CASE(test::Type::Feature)

    evt::MessageStack stack;
    stack.Push(1);

    // messages below the base are not visible.
    const auto base = stack.SetBase();
    TEST_REQUIRE(base == 0);
    TEST_REQUIRE(!stack.HasAny());
    TEST_REQUIRE(!stack.TryPop<int>().has_value());
    TEST_REQUIRE(stack.TryPeek<int>() == nullptr);
    TEST_REQUIRE(stack.TryObserve<int>() == nullptr);
    TEST_REQUIRE(!stack.PopErased().has_value());

    stack.Push(2);
    TEST_REQUIRE(stack.TryPop<int>().value() == 2);
    TEST_REQUIRE(!stack.TryPop<int>().has_value());

    stack.Push(3);
    stack.Push(4);
    TEST_REQUIRE(stack.DropUnhandled() == 2);
    TEST_REQUIRE(stack.GetSize() == 1);

    // nested base
    stack.Push(5);
    const auto outer = stack.SetBase();
    TEST_REQUIRE(outer == 1);
    stack.Push(6);
    TEST_REQUIRE(stack.TryPop<int>().value() == 6);
    TEST_REQUIRE(!stack.HasAny());
    stack.RestoreBase(outer);
    TEST_REQUIRE(stack.TryPop<int>().value() == 5);
    TEST_REQUIRE(!stack.HasAny());

    // the message pushed before the base becomes visible again.
    stack.RestoreBase(base);
    TEST_REQUIRE(stack.HasAny());
    TEST_REQUIRE(stack.TryPop<int>().value() == 1);

    stack.Push(7);
    stack.SetBase();
    TEST_REQUIRE(!stack.HasAny());
    TEST_REQUIRE(stack.ResetAndHasAny());
    TEST_REQUIRE(stack.GetBase() == 0);
    TEST_REQUIRE(stack.TryPop<int>().value() == 7);
    TEST_REQUIRE(!stack.ResetAndHasAny());
}

void unit_test_stack_drop()
{
    TEST_CASE(test::Type::Feature)

    evt::MessageStack stack;
    stack.Push(evt::msg::KineticStart {});
    stack.Push(evt::msg::SetValueText { "foo" });
    stack.Push(evt::msg::SetValueF64 { 1.0 });
    TEST_REQUIRE(stack.DropUnhandled() == 3);
    TEST_REQUIRE(!stack.HasAny());
    TEST_REQUIRE(stack.GetSize() == 0);

    // dropped on destruction
    {
        evt::MessageStack other;
        other.Push(1);
        other.SetBase();
    }
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    test::TestLogger logger("unit_test_message.log");

    unit_test_erased();
    unit_test_stack_push_pop();
    unit_test_stack_base();
    unit_test_stack_drop();
    return 0;
}
) // TEST_MAIN
