/// @file player_directory.cpp
/// @brief PlayerDirectory implementation.

#include "tre/feed/player_directory.hpp"

#include <utility>

namespace tre::feed {

PlayerId PlayerDirectory::intern(std::string_view name) {
    std::string key(name);
    auto it = ids_.find(key);
    if (it != ids_.end()) {
        return it->second;
    }
    names_.push_back(key);
    PlayerId id(names_.size());
    ids_.emplace(std::move(key), id);
    return id;
}

std::optional<PlayerId> PlayerDirectory::find(std::string_view name) const {
    auto it = ids_.find(std::string(name));
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> PlayerDirectory::nameOf(PlayerId id) const {
    if (!id.isValid() || id.value() > names_.size()) {
        return std::nullopt;
    }
    return names_[id.value() - 1];
}

} // namespace tre::feed
