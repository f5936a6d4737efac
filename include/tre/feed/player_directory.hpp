#pragma once

/// @file player_directory.hpp
/// @brief Interning of player names into PlayerId values.

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tre/foundation/types.hpp"

namespace tre::feed {

using foundation::PlayerId;

/// Bidirectional name <-> PlayerId map shared by every source of a run.
///
/// Ids are assigned sequentially from 1 in order of first appearance, so the
/// same feed always yields the same ids.
class PlayerDirectory {
public:
    /// Id for @p name, assigning the next id on first sight.
    PlayerId intern(std::string_view name);

    [[nodiscard]] std::optional<PlayerId> find(std::string_view name) const;

    /// Name of @p id, or nullopt for ids this directory never issued.
    [[nodiscard]] std::optional<std::string> nameOf(PlayerId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

private:
    std::unordered_map<std::string, PlayerId> ids_;
    std::vector<std::string> names_;  ///< names_[id - 1]
};

} // namespace tre::feed
