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

#include <chrono>
#include <optional>
#include <vector>

#include "evtcore/types.h"
#include "evtcore/id.h"
#include "evtcore/event.h"

namespace evt
{
    class EventCx;
    class EventState;
    class ConfigCx;

    // Node is the interface between the event core and the widget tree.
    // The core never depends on any concrete widget type, only on the
    // small set of operations here. Every node is addressed by an Id that
    // is assigned by the configure pass.
    class Node
    {
    public:
        virtual ~Node() = default;

        virtual const Id& GetId() const = 0;
        virtual void SetId(const Id& id) = 0;

        virtual std::size_t GetNumChildren() const = 0;
        virtual Node* GetChild(std::size_t index) = 0;
        virtual const Node* GetChild(std::size_t index) const = 0;

        // Get the rect of the node in the parent's coordinate space.
        virtual Rect GetRect() const = 0;

        // Whether the node can receive navigation focus.
        virtual bool IsNavigable() const
        { return false; }

        // Translation applied to coordinates when going from this node
        // into the children, for example the scroll offset of a scroll view.
        virtual Offset GetTranslation() const
        { return Offset(0, 0); }

        // Find the index of the child that is (or contains) the given id.
        // The default implementation uses the child index key following
        // this node's id.
        virtual std::optional<std::size_t> FindChildIndex(const Id& id) const;

        // Find the Id of the deepest node under the coordinate. The
        // coordinate is in this node's coordinate space. The default
        // implementation probes the children from the topmost (last)
        // and falls back to this node.
        virtual Id Probe(const Coord& coord) const;

        // Called once during the configure pass after the id has been
        // assigned and before the children are configured.
        virtual void Configure(ConfigCx& cx) {}

        // Called when the node is updated with new input data.
        virtual void Update(ConfigCx& cx) {}

        // Handle an event addressed to this node or bubbled up from a
        // descendant that left the event unused.
        virtual IsUsed HandleEvent(EventCx& cx, const Event& event)
        { return IsUsed::Unused; }

        // Handle messages left on the message stack by the descendants.
        virtual void HandleMessages(EventCx& cx) {}

        // Handle a scroll request set by a descendant.
        virtual void HandleScroll(EventCx& cx, const Scroll& scroll) {}
    };

    // Find a node by id in the tree rooted at the given node.
    Node* FindNode(Node& root, const Id& id);
    const Node* FindNode(const Node& root, const Id& id);

    // Find the rect of the node in window coordinates.
    std::optional<Rect> FindNodeRect(const Node& root, const Id& id);

    // Configuration context. Passed to the nodes during configure and
    // update passes for registering the properties they need from the
    // event core.
    class ConfigCx
    {
    public:
        explicit ConfigCx(EventState& state) noexcept
          : mState(state)
        {}

        // Configure the node and its children. The node gets the given
        // id and the children get their ids derived from it.
        void Configure(Node& node, const Id& id);

        // Update the node and its children.
        void Update(Node& node);

        // Register the node as the nav fallback. The first node to
        // register wins.
        void RegisterNavFallback(const Id& id);

        // Create a new accelerator key layer rooted at the node.
        void NewAccelLayer(const Id& id, bool alt_bypass);

        // Bind the keys to the node in the nearest accelerator layer.
        void AddAccelKeys(const Id& id, const std::vector<Key>& keys);

        void SetDisabled(const Id& id, bool disabled);

        void RequestTimer(const Id& id, TimerHandle handle, std::chrono::milliseconds delay);

        inline EventState& GetState() noexcept
        { return mState; }
    private:
        EventState& mState;
    };

} // namespace
