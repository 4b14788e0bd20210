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
#include <cmath>

#include "base/assert.h"
#include "base/logging.h"
#include "evtcore/press.h"

namespace {
using namespace evt;

inline DVec2 ComplexMul(const DVec2& a, const DVec2& b)
{
    return DVec2(a.x * b.x - a.y * b.y, a.x * b.y + a.y * b.x);
}
inline DVec2 ComplexDiv(const DVec2& b, const DVec2& a)
{
    const auto len2 = a.x * a.x + a.y * a.y;
    return DVec2(b.x * a.x + b.y * a.y, b.y * a.x - b.x * a.y) / len2;
}
inline double SumSquare(const DVec2& v)
{
    return v.x * v.x + v.y * v.y;
}
// Click < Drag, a click grab can be upgraded to a drag grab.
inline GrabMode MaxMode(GrabMode a, GrabMode b)
{
    return static_cast<int>(a) > static_cast<int>(b) ? a : b;
}

} // namespace

namespace evt
{

PanEvent ComputePan(GrabMode mode, const DVec2& p1, const DVec2& q1,
                    const DVec2& p2, const DVec2& q2)
{
    const auto a = p2 - p1;
    const auto b = q2 - q1;

    PanEvent pan;
    if (mode == GrabMode::PanScale)
        pan.alpha = DVec2(std::sqrt(SumSquare(b) / SumSquare(a)), 0.0);
    else if (mode == GrabMode::PanRotate)
    {
        const auto alpha = ComplexDiv(b, a);
        pan.alpha = alpha / std::sqrt(SumSquare(alpha));
    }
    else if (mode == GrabMode::PanFull)
        pan.alpha = ComplexDiv(b, a);
    else pan.alpha = DVec2(1.0, 0.0);

    // average of the motion of both points
    pan.delta = (q1 - ComplexMul(pan.alpha, p1) + q2 - ComplexMul(pan.alpha, p2)) * 0.5;
    return pan;
}

bool IsIdentity(const PanEvent& pan) noexcept
{
    return pan.alpha == DVec2(1.0, 0.0) && pan.delta == DVec2(0.0, 0.0);
}

bool IsFinite(const PanEvent& pan) noexcept
{
    return std::isfinite(pan.alpha.x) && std::isfinite(pan.alpha.y) &&
           std::isfinite(pan.delta.x) && std::isfinite(pan.delta.y);
}

bool PressState::StartMouseGrab(const Id& id, MouseButton button, unsigned repetitions,
                                const Coord& coord, GrabMode mode, std::optional<CursorIcon> icon)
{
    if (mMouseGrab.has_value())
    {
        auto& grab = mMouseGrab.value();
        if (grab.start_id != id || grab.button != button || IsPan(grab.mode) != IsPan(mode))
            return false;

        grab.repetitions = std::max(grab.repetitions, repetitions);
        grab.depress = id;
        if (!IsPan(mode))
            grab.mode = MaxMode(grab.mode, mode);
        if (icon.has_value())
            grab.icon = icon;
        return true;
    }

    PanIndex pan;
    if (IsPan(mode))
        pan = SetPanOn(id, mode, false, coord);

    MouseGrab grab;
    grab.button      = button;
    grab.repetitions = repetitions;
    grab.start_id    = id;
    grab.depress     = id;
    grab.coord       = coord;
    grab.mode        = mode;
    grab.pan         = pan;
    grab.icon        = icon;
    mMouseGrab = std::move(grab);
    DEBUG("Start mouse grab. [id=%1, button=%2, mode=%3]", id, button, mode);
    return true;
}

bool PressState::StartTouchGrab(std::uint64_t touch_id, const Id& id, const Coord& coord, GrabMode mode)
{
    if (auto* grab = GetTouch(touch_id))
    {
        if (grab->start_id != id || IsPan(grab->mode) != IsPan(mode))
            return false;

        grab->depress = id;
        grab->over    = id;
        grab->coord   = coord;
        if (!IsPan(mode))
            grab->mode = MaxMode(grab->mode, mode);
        return true;
    }
    if (mTouchGrabs.size() >= EVT_MAX_TOUCHES)
    {
        VERBOSE("Too many touch grabs. Ignoring touch. [touch=%1]", touch_id);
        return false;
    }

    PanIndex pan;
    if (IsPan(mode))
        pan = SetPanOn(id, mode, true, coord);

    TouchGrab grab;
    grab.touch_id = touch_id;
    grab.start_id = id;
    grab.depress  = id;
    grab.over     = id;
    grab.coord    = coord;
    grab.mode     = mode;
    grab.pan      = pan;
    mTouchGrabs.push_back(std::move(grab));
    DEBUG("Start touch grab. [id=%1, touch=%2, mode=%3]", id, touch_id, mode);
    return true;
}

std::optional<EndedGrab> PressState::EndMouseGrab(bool success, const std::optional<Id>& over, const Coord& coord)
{
    if (!mMouseGrab.has_value())
        return std::nullopt;

    MouseGrab grab = std::move(mMouseGrab.value());
    mMouseGrab.reset();
    RemovePanGrab(grab.pan);
    DEBUG("End mouse grab. [id=%1, success=%2]", grab.start_id, success);

    EndedGrab ret;
    ret.owner   = grab.start_id;
    ret.depress = grab.depress;
    if (!IsPan(grab.mode))
    {
        PressEndEvent end;
        end.press.source = PressSource::Mouse(grab.button, grab.repetitions);
        end.press.id     = over;
        end.press.coord  = coord;
        end.success      = success;
        ret.event = end;
    }
    return ret;
}

EndedGrab PressState::EndTouchGrab(std::size_t index, bool success, const Coord& coord)
{
    ASSERT(index < mTouchGrabs.size());
    TouchGrab grab = std::move(mTouchGrabs[index]);
    mTouchGrabs.erase(mTouchGrabs.begin() + index);
    RemovePanGrab(grab.pan);
    DEBUG("End touch grab. [id=%1, touch=%2, success=%3]", grab.start_id, grab.touch_id, success);

    EndedGrab ret;
    ret.owner   = grab.start_id;
    ret.depress = grab.depress;
    if (!IsPan(grab.mode))
    {
        PressEndEvent end;
        end.press.source = PressSource::Touch(grab.touch_id);
        end.press.id     = grab.over;
        end.press.coord  = coord;
        end.success      = success;
        ret.event = end;
    }
    return ret;
}

std::vector<EndedGrab> PressState::CancelGrabsOn(const Id& target, const std::optional<Id>& hover, const Coord& mouse_coord)
{
    std::vector<EndedGrab> ret;
    if (mMouseGrab.has_value() && target.IsAncestorOf(mMouseGrab->start_id))
    {
        if (auto ended = EndMouseGrab(false, hover, mouse_coord))
            ret.push_back(std::move(ended.value()));
    }
    for (std::size_t i=0; i<mTouchGrabs.size();)
    {
        if (target.IsAncestorOf(mTouchGrabs[i].start_id))
        {
            const auto coord = mTouchGrabs[i].coord;
            ret.push_back(EndTouchGrab(i, false, coord));
        }
        else ++i;
    }
    return ret;
}

bool PressState::DropGrabsOf(const Id& owner)
{
    bool dropped = false;
    if (mMouseGrab.has_value() && mMouseGrab->start_id == owner)
    {
        const auto pan = mMouseGrab->pan;
        mMouseGrab.reset();
        RemovePanGrab(pan);
        dropped = true;
    }
    for (std::size_t i=0; i<mTouchGrabs.size();)
    {
        if (mTouchGrabs[i].start_id == owner)
        {
            const auto pan = mTouchGrabs[i].pan;
            mTouchGrabs.erase(mTouchGrabs.begin() + i);
            RemovePanGrab(pan);
            dropped = true;
        }
        else ++i;
    }
    if (dropped)
        DEBUG("Dropped grabs. [id=%1]", owner);
    return dropped;
}

TouchGrab* PressState::GetTouch(std::uint64_t touch_id) noexcept
{
    for (auto& grab : mTouchGrabs)
    {
        if (grab.touch_id == touch_id)
            return &grab;
    }
    return nullptr;
}

std::optional<std::size_t> PressState::GetTouchIndex(std::uint64_t touch_id) const noexcept
{
    for (std::size_t i=0; i<mTouchGrabs.size(); ++i)
    {
        if (mTouchGrabs[i].touch_id == touch_id)
            return i;
    }
    return std::nullopt;
}

void PressState::UpdatePanCoord(const PanIndex& pan, const Coord& coord)
{
    if (!pan.IsValid() || pan.grab >= mPanGrabs.size())
        return;
    if (pan.index >= EVT_MAX_PAN_GRABS)
        return;
    mPanGrabs[pan.grab].coords[pan.index].second = DVec2(coord);
}

std::vector<std::pair<Id, PanEvent>> PressState::FlushPans()
{
    std::vector<std::pair<Id, PanEvent>> ret;
    for (auto& grab : mPanGrabs)
    {
        ASSERT(grab.n > 0);

        // p are the old coordinates, q are the new coordinates
        const auto p1 = grab.coords[0].first;
        const auto q1 = grab.coords[0].second;
        grab.coords[0].first = grab.coords[0].second;

        PanEvent pan;
        if (grab.n == 1)
        {
            pan.delta = q1 - p1;
        }
        else
        {
            // only the first two sources are needed.
            const auto p2 = grab.coords[1].first;
            const auto q2 = grab.coords[1].second;
            grab.coords[1].first = grab.coords[1].second;
            pan = ComputePan(grab.mode, p1, q1, p2, q2);
        }
        if (IsFinite(pan) && !IsIdentity(pan))
            ret.push_back(std::make_pair(grab.id, pan));
    }
    return ret;
}

bool PressState::FlushClickMove(const std::optional<Id>& hover)
{
    bool changed = false;
    const auto update = [&changed](const Id& start_id, const std::optional<Id>& over, std::optional<Id>& depress) {
        if (over.has_value() && start_id == over.value())
        {
            if (depress != over)
            {
                depress = over;
                changed = true;
            }
        }
        else if (depress.has_value())
        {
            depress.reset();
            changed = true;
        }
    };

    if (mMouseGrab.has_value() && mMouseGrab->mode == GrabMode::Click)
        update(mMouseGrab->start_id, hover, mMouseGrab->depress);

    for (auto& grab : mTouchGrabs)
    {
        if (grab.mode == GrabMode::Click)
            update(grab.start_id, grab.over, grab.depress);
    }
    return changed;
}

bool PressState::SetGrabDepress(const PressSource& source, const std::optional<Id>& target)
{
    if (source.IsMouse())
    {
        if (!mMouseGrab.has_value() || mMouseGrab->button != source.GetButton())
            return false;
        if (mMouseGrab->depress == target)
            return false;
        mMouseGrab->depress = target;
        return true;
    }
    auto* grab = GetTouch(source.GetTouchId());
    if (grab == nullptr || grab->depress == target)
        return false;
    grab->depress = target;
    return true;
}

bool PressState::IsDepressed(const Id& id) const noexcept
{
    if (mMouseGrab.has_value() && mMouseGrab->depress == id)
        return true;
    for (const auto& grab : mTouchGrabs)
    {
        if (grab.depress == id)
            return true;
    }
    return false;
}

void PressState::Clear()
{
    mMouseGrab.reset();
    mTouchGrabs.clear();
    mPanGrabs.clear();
}

PanIndex PressState::SetPanOn(const Id& id, GrabMode mode, bool source_is_touch, const Coord& coord)
{
    const DVec2 p(coord);
    for (std::size_t gi=0; gi<mPanGrabs.size(); ++gi)
    {
        auto& grab = mPanGrabs[gi];
        if (grab.id != id)
            continue;
        if (grab.mode != mode)
            WARN("Pan grab mode mismatch. [id=%1, mode=%2, grab=%3]", id, mode, grab.mode);

        const std::size_t index = grab.n;
        if (index < EVT_MAX_PAN_GRABS)
            grab.coords[index] = std::make_pair(p, p);
        grab.n = index + 1;
        return PanIndex { gi, index };
    }
    if (mPanGrabs.size() >= EVT_MAX_PAN_GRABS)
        return PanIndex {};

    PanGrab grab;
    grab.id   = id;
    grab.mode = mode;
    grab.source_is_touch = source_is_touch;
    grab.n    = 1;
    grab.coords[0] = std::make_pair(p, p);
    mPanGrabs.push_back(grab);
    DEBUG("Start pan grab. [id=%1, index=%2]", id, mPanGrabs.size()-1);
    return PanIndex { mPanGrabs.size() - 1, 0 };
}

void PressState::RemovePanGrab(const PanIndex& pan)
{
    if (!pan.IsValid() || pan.grab >= mPanGrabs.size())
        return;

    auto& grab = mPanGrabs[pan.grab];
    grab.n -= 1;
    if (grab.n == 0)
    {
        RemovePan(pan.grab);
        return;
    }
    for (std::size_t i=pan.index; i+1<EVT_MAX_PAN_GRABS && i<grab.n; ++i)
        grab.coords[i] = grab.coords[i+1];

    // shift the sources after the removed one down. a source that moves
    // into the tracked range starts from its current position.
    const auto shift = [this, &pan](PanIndex& other, const Coord& coord) {
        if (other.grab != pan.grab || other.index <= pan.index)
            return;
        other.index -= 1;
        if (other.index == EVT_MAX_PAN_GRABS - 1)
        {
            const DVec2 p(coord);
            mPanGrabs[pan.grab].coords[other.index] = std::make_pair(p, p);
        }
    };
    for (auto& touch : mTouchGrabs)
        shift(touch.pan, touch.coord);
    if (mMouseGrab.has_value())
        shift(mMouseGrab->pan, mMouseGrab->coord);
}

void PressState::RemovePan(std::size_t index)
{
    DEBUG("Remove pan grab. [index=%1]", index);
    mPanGrabs.erase(mPanGrabs.begin() + index);

    const auto fix = [index](PanIndex& pan) {
        if (pan.IsValid() && pan.grab > index)
            pan.grab -= 1;
    };
    for (auto& touch : mTouchGrabs)
        fix(touch.pan);
    if (mMouseGrab.has_value())
        fix(mMouseGrab->pan);
}

} // namespace
