#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared by every layer of the core.

#include <cstdint>
#include <functional>
#include <ostream>

namespace dai::foundation {

/// Tag-based strong typedef over the host's integral handles.
///
/// Zero is reserved by every host as "no entity", so a default-constructed
/// id is invalid.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

template <typename Tag, typename T>
std::ostream& operator<<(std::ostream& os, const StrongId<Tag, T>& id) {
    return os << '#' << id.value();
}

struct EntityIdTag {};

/// Opaque identifier of a host entity (AI, player, marker, ...).
using EntityId = StrongId<EntityIdTag>;

/// Broadcast recipient and "no player" marker.
inline constexpr EntityId kNoEntity{};

}  // namespace dai::foundation

template <typename Tag, typename T>
struct std::hash<dai::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const dai::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
