#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the feed, the rating store and the exporters.

#include <compare>
#include <cstdint>
#include <functional>

namespace tre::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
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

struct PlayerIdTag {};

/// Identifier of a player, interned from the player's name by PlayerDirectory.
/// Zero is reserved for "no player".
using PlayerId = StrongId<PlayerIdTag>;

} // namespace tre::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<tre::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tre::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
