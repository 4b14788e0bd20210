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
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <type_traits>
#include <vector>

#include "evtcore/types.h"

namespace evt
{
    // Erased is a type erased message value. The dynamic type of the
    // value can be tested and the value can be taken out with the
    // matching static type.
    class Erased
    {
    public:
        template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Erased>>>
        explicit Erased(T&& value)
          : mValue(std::make_unique<Holder<std::decay_t<T>>>(std::forward<T>(value)))
        {}
        Erased(Erased&& other) = default;
        Erased& operator=(Erased&& other) = default;

        template<typename T>
        bool Is() const noexcept
        { return mValue && mValue->GetType() == typeid(T); }

        // Get a pointer to the value if the dynamic type is T
        // otherwise nullptr.
        template<typename T>
        const T* Get() const noexcept
        {
            if (!Is<T>())
                return nullptr;
            return &static_cast<const Holder<T>*>(mValue.get())->value;
        }

        // Move the value out if the dynamic type is T. After a
        // successful take the Erased object is empty.
        template<typename T>
        std::optional<T> Take()
        {
            if (!Is<T>())
                return std::nullopt;
            auto* holder = static_cast<Holder<T>*>(mValue.get());
            std::optional<T> ret(std::move(holder->value));
            mValue.reset();
            return ret;
        }

        inline bool IsEmpty() const noexcept
        { return !mValue; }

        std::string GetTypeName() const;
    private:
        struct HolderBase {
            virtual ~HolderBase() = default;
            virtual const std::type_info& GetType() const noexcept = 0;
        };
        template<typename T>
        struct Holder : public HolderBase {
            template<typename U>
            explicit Holder(U&& u) : value(std::forward<U>(u))
            {}
            virtual const std::type_info& GetType() const noexcept override
            { return typeid(T); }
            T value;
        };
        std::unique_ptr<HolderBase> mValue;
    };

    // MessageStack is the channel used by widgets to communicate upwards
    // to their ancestors during a dispatch pass. Messages are pushed
    // by a descendant and popped by the ancestor that understands them.
    //
    // The base watermark sandboxes a nested traversal. Messages below
    // the base (pushed before SetBase) are invisible until the base is
    // restored.
    class MessageStack
    {
    public:
        MessageStack() = default;
        MessageStack(const MessageStack&) = delete;
       ~MessageStack();
        MessageStack& operator=(const MessageStack&) = delete;

        // Set the base watermark to the current top of the stack and
        // return the previous base.
        std::size_t SetBase() noexcept;
        // Restore the base watermark to a value returned by SetBase.
        void RestoreBase(std::size_t base) noexcept;
        inline std::size_t GetBase() const noexcept
        { return mBase; }

        // Reset the base to zero and return whether the stack has
        // any messages at all.
        bool ResetAndHasAny() noexcept;

        // Whether there are any messages above the base.
        inline bool HasAny() const noexcept
        { return mStack.size() > mBase; }

        // Get the total number of push and pop operations. Can be used
        // to detect whether some handler touched the stack.
        inline std::size_t GetOpCount() const noexcept
        { return mOpCount; }

        inline std::size_t GetSize() const noexcept
        { return mStack.size(); }

        template<typename T>
        void Push(T&& msg)
        { PushErased(Erased(std::forward<T>(msg))); }

        void PushErased(Erased msg);

        // Pop the top message if it is above the base and its type is T.
        template<typename T>
        std::optional<T> TryPop()
        {
            if (!HasAny() || !mStack.back().Is<T>())
                return std::nullopt;
            auto ret = mStack.back().Take<T>();
            mStack.pop_back();
            ++mOpCount;
            return ret;
        }

        // Observe the top message without consuming it if it is above
        // the base and its type is T.
        template<typename T>
        const T* TryPeek() const
        {
            if (!HasAny())
                return nullptr;
            return mStack.back().Get<T>();
        }
        template<typename T>
        const T* TryObserve() const
        { return TryPeek<T>(); }

        // Pop the top message above the base regardless of its type.
        std::optional<Erased> PopErased();

        // Drop every message above the base. Each dropped message is
        // logged as unhandled. Returns the number of dropped messages.
        std::size_t DropUnhandled();
    private:
        std::vector<Erased> mStack;
        std::size_t mBase = 0;
        std::size_t mOpCount = 0;
    };

    // Standard messages understood by the common widgets.
    namespace msg {
        // Activate the widget, for example a button click.
        struct Activate {
            std::optional<PhysicalKey> code;
        };
        struct IncrementStep {};
        struct DecrementStep {};
        struct SetValueF64 {
            double value = 0.0;
        };
        struct SetValueText {
            std::string value;
        };
        struct ReplaceSelectedText {
            std::string text;
        };
        struct SetIndex {
            std::size_t index = 0;
        };
        struct Select {};
        struct SetScrollOffset {
            Offset offset = {0, 0};
        };
        // Kinetic scrolling started. Pushed for any interested ancestor
        // and fine to leave unhandled.
        struct KineticStart {};
    } // namespace msg

    bool IsSafeToIgnore(const Erased& message) noexcept;

} // namespace
