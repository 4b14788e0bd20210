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

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "evtcore/node.h"
#include "evtcore/runner.h"
#include "evtcore/message.h"
#include "evtcore/event_cx.h"

namespace test
{
    // Widget tree node for driving the event core in tests. Child rects
    // are given in window coordinates. Every delivered event is recorded
    // by name and the handlers can be customized per node.
    class TestNode : public evt::Node
    {
    public:
        explicit TestNode(std::string name, const evt::Rect& rect = evt::Rect{}, bool navigable = false)
          : name(std::move(name))
          , rect(rect)
          , navigable(navigable)
        {}

        TestNode* AddChild(std::string name, const evt::Rect& rect, bool navigable = false)
        {
            children.push_back(std::make_unique<TestNode>(std::move(name), rect, navigable));
            return children.back().get();
        }

        virtual const evt::Id& GetId() const override
        { return id; }
        virtual void SetId(const evt::Id& id) override
        { this->id = id; }
        virtual std::size_t GetNumChildren() const override
        { return children.size(); }
        virtual evt::Node* GetChild(std::size_t index) override
        { return children[index].get(); }
        virtual const evt::Node* GetChild(std::size_t index) const override
        { return children[index].get(); }
        virtual evt::Rect GetRect() const override
        { return rect; }
        virtual bool IsNavigable() const override
        { return navigable; }
        virtual void Configure(evt::ConfigCx& cx) override
        {
            ++configure_count;
            if (on_configure)
                on_configure(cx);
        }
        virtual void Update(evt::ConfigCx& cx) override
        { ++update_count; }
        virtual evt::IsUsed HandleEvent(evt::EventCx& cx, const evt::Event& event) override
        {
            events.push_back(evt::GetEventName(event));
            if (on_event)
                return on_event(cx, event);
            return evt::IsUsed::Unused;
        }
        virtual void HandleMessages(evt::EventCx& cx) override
        {
            if (on_messages)
                on_messages(cx);
        }
        virtual void HandleScroll(evt::EventCx& cx, const evt::Scroll& scroll) override
        {
            scrolls.push_back(scroll);
        }

        std::size_t CountEvents(const std::string& name) const
        {
            std::size_t count = 0;
            for (const auto& e : events)
            {
                if (e == name)
                    ++count;
            }
            return count;
        }
        bool HasEvent(const std::string& name) const
        { return CountEvents(name) > 0; }

        std::string name;
        evt::Id id;
        evt::Rect rect;
        bool navigable = false;
        std::vector<std::unique_ptr<TestNode>> children;
        std::vector<std::string> events;
        std::vector<evt::Scroll> scrolls;
        unsigned configure_count = 0;
        unsigned update_count = 0;
        std::function<void (evt::ConfigCx&)> on_configure;
        std::function<evt::IsUsed (evt::EventCx&, const evt::Event&)> on_event;
        std::function<void (evt::EventCx&)> on_messages;
    };

    // root
    //  +- a (navigable)
    //  |   +- b (navigable)
    //  |   +- c (navigable)
    //  +- d
    //      +- e (navigable)
    struct TestTree {
        std::unique_ptr<TestNode> root;
        TestNode* a = nullptr;
        TestNode* b = nullptr;
        TestNode* c = nullptr;
        TestNode* d = nullptr;
        TestNode* e = nullptr;

        TestTree()
        {
            root = std::make_unique<TestNode>("root", evt::Rect { {0, 0}, {200, 200} });
            a = root->AddChild("a", evt::Rect { {0, 0}, {100, 100} }, true);
            b = a->AddChild("b", evt::Rect { {0, 0}, {50, 50} }, true);
            c = a->AddChild("c", evt::Rect { {50, 0}, {50, 50} }, true);
            d = root->AddChild("d", evt::Rect { {100, 0}, {100, 100} });
            e = d->AddChild("e", evt::Rect { {100, 0}, {100, 50} }, true);
        }
        void ClearEvents()
        {
            for (auto* node : {root.get(), a, b, c, d, e})
            {
                node->events.clear();
                node->scrolls.clear();
            }
        }
    };

    class TestWaker : public evt::Waker
    {
    public:
        virtual void Wake() override
        { ++wake_count; }
        std::atomic<unsigned> wake_count = {0};
    };

    // Platform stand-in recording the requests from the event core.
    class TestRunner : public evt::Runner
    {
    public:
        virtual evt::WindowId AddPopup(const evt::PopupDescriptor& desc) override
        {
            popups_opened.push_back(desc.id);
            return next_window++;
        }
        virtual void RepositionPopup(evt::WindowId window, const evt::PopupDescriptor& desc) override
        { ++reposition_count; }
        virtual evt::WindowId AddWindow(const evt::WindowDescriptor& desc) override
        { return next_window++; }
        virtual void CloseWindow(evt::WindowId window) override
        { windows_closed.push_back(window); }
        virtual std::optional<std::string> GetClipboard() override
        { return clipboard; }
        virtual bool SetClipboard(const std::string& content) override
        {
            if (fail_clipboard)
                return false;
            clipboard = content;
            return true;
        }
        virtual std::optional<std::string> GetPrimary() override
        { return std::nullopt; }
        virtual bool SetPrimary(const std::string& content) override
        { return false; }
        virtual void SetCursorIcon(evt::CursorIcon icon) override
        { cursor_icons.push_back(icon); }
        virtual bool SetImeAllowed(std::optional<evt::ImePurpose> purpose) override
        {
            ime_requests.push_back(purpose);
            return ime_available;
        }
        virtual void Exit() override
        { ++exit_count; }
        virtual std::shared_ptr<evt::Waker> GetWaker() override
        { return waker; }
        virtual base::ThreadPool* GetThreadPool() override
        { return pool; }

        evt::WindowId next_window = 100;
        std::vector<evt::Id> popups_opened;
        std::vector<evt::WindowId> windows_closed;
        std::vector<evt::CursorIcon> cursor_icons;
        std::vector<std::optional<evt::ImePurpose>> ime_requests;
        std::optional<std::string> clipboard;
        bool fail_clipboard = false;
        bool ime_available = true;
        unsigned exit_count = 0;
        unsigned reposition_count = 0;
        std::shared_ptr<TestWaker> waker = std::make_shared<TestWaker>();
        base::ThreadPool* pool = nullptr;
    };

    // Application data that takes the string messages nobody else took.
    class TestAppData : public evt::AppData
    {
    public:
        virtual evt::ActionFlags HandleMessages(evt::MessageStack& messages) override
        {
            while (auto msg = messages.TryPop<std::string>())
                strings.push_back(std::move(msg.value()));
            return action;
        }
        virtual void Suspended() override
        { ++suspend_count; }

        std::vector<std::string> strings;
        evt::ActionFlags action;
        unsigned suspend_count = 0;
    };

} // namespace
