// SPDX-License-Identifier: Apache-2.0
#include "worker/model.hpp"

namespace hdw {

const char *event_kind_name(EventKind kind) noexcept
{
    switch (kind) {
        case EventKind::join:
            return "join";
        case EventKind::leave:
            return "leave";
    }
    return "join";
}

std::optional<EventKind> parse_event_kind(std::string_view name) noexcept
{
    if (name == "join")
        return EventKind::join;
    if (name == "leave")
        return EventKind::leave;
    return std::nullopt;
}

} // namespace hdw
