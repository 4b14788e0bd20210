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

#include "base/logging.h"
#include "evtcore/node.h"
#include "evtcore/event_state.h"

namespace {
using namespace evt;

template<typename NodeT>
NodeT* FindNodeImpl(NodeT& root, const Id& id)
{
    NodeT* node = &root;
    while (node)
    {
        if (node->GetId() == id)
            return node;
        if (!node->GetId().IsAncestorOf(id))
            return nullptr;
        const auto index = node->FindChildIndex(id);
        if (!index.has_value())
            return nullptr;
        node = node->GetChild(index.value());
    }
    return nullptr;
}

} // namespace

namespace evt
{

std::optional<std::size_t> Node::FindChildIndex(const Id& id) const
{
    const auto key = id.NextKeyAfter(GetId());
    if (!key.has_value())
        return std::nullopt;
    if (key.value() >= GetNumChildren())
        return std::nullopt;
    return key;
}

Id Node::Probe(const Coord& coord) const
{
    const auto child_coord = coord + GetTranslation();
    for (std::size_t i=GetNumChildren(); i>0; --i)
    {
        const auto* child = GetChild(i-1);
        if (child && child->GetRect().Contains(child_coord))
            return child->Probe(child_coord);
    }
    return GetId();
}

Node* FindNode(Node& root, const Id& id)
{
    return FindNodeImpl(root, id);
}

const Node* FindNode(const Node& root, const Id& id)
{
    return FindNodeImpl(root, id);
}

std::optional<Rect> FindNodeRect(const Node& root, const Id& id)
{
    // accumulate the translations of the ancestors
    Offset offset(0, 0);
    const Node* node = &root;
    while (node)
    {
        if (node->GetId() == id)
        {
            Rect rect = node->GetRect();
            rect.pos -= offset;
            return rect;
        }
        if (!node->GetId().IsAncestorOf(id))
            return std::nullopt;
        const auto index = node->FindChildIndex(id);
        if (!index.has_value())
            return std::nullopt;
        offset += node->GetTranslation();
        node = node->GetChild(index.value());
    }
    return std::nullopt;
}

void ConfigCx::Configure(Node& node, const Id& id)
{
    node.SetId(id);
    node.Configure(*this);
    for (std::size_t i=0; i<node.GetNumChildren(); ++i)
    {
        if (auto* child = node.GetChild(i))
            Configure(*child, id.MakeChild(i));
    }
}

void ConfigCx::Update(Node& node)
{
    node.Update(*this);
    for (std::size_t i=0; i<node.GetNumChildren(); ++i)
    {
        if (auto* child = node.GetChild(i))
            Update(*child);
    }
}

void ConfigCx::RegisterNavFallback(const Id& id)
{
    mState.RegisterNavFallback(id);
}

void ConfigCx::NewAccelLayer(const Id& id, bool alt_bypass)
{
    mState.NewAccelLayer(id, alt_bypass);
}

void ConfigCx::AddAccelKeys(const Id& id, const std::vector<Key>& keys)
{
    mState.AddAccelKeys(id, keys);
}

void ConfigCx::SetDisabled(const Id& id, bool disabled)
{
    mState.SetDisabled(id, disabled);
}

void ConfigCx::RequestTimer(const Id& id, TimerHandle handle, std::chrono::milliseconds delay)
{
    mState.RequestTimer(id, handle, delay);
}

} // namespace
