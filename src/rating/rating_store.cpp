/// @file rating_store.cpp
/// @brief RatingStore and RatingSnapshot implementation.

#include "tre/rating/rating_store.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tre/rating/blender.hpp"
#include "tre/rating/form_tracker.hpp"

namespace tre::rating {

using foundation::EngineError;
using foundation::ErrorCode;

// ---------------------------------------------------------------------------
// RatingSnapshot
// ---------------------------------------------------------------------------
RatingSnapshot::RatingSnapshot(Date asOf, std::vector<PlayerRatingRecord> records)
    : asOf_(asOf), records_(std::move(records)) {
    std::sort(records_.begin(), records_.end(),
              [](const PlayerRatingRecord& lhs, const PlayerRatingRecord& rhs) {
                  if (lhs.effectiveRating != rhs.effectiveRating) {
                      return lhs.effectiveRating > rhs.effectiveRating;
                  }
                  return lhs.id < rhs.id;
              });
}

const PlayerRatingRecord* RatingSnapshot::find(PlayerId id) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [id](const PlayerRatingRecord& r) { return r.id == id; });
    return it == records_.end() ? nullptr : &*it;
}

std::optional<std::size_t> RatingSnapshot::rankOf(PlayerId id) const {
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].id == id) {
            return i + 1;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// RatingStore
// ---------------------------------------------------------------------------
RatingStore::RatingStore(double defaultBaseline, double baselineFraction)
    : defaultBaseline_(defaultBaseline),
      baselineFraction_(baselineFraction),
      unregistered_(makePlayer(PlayerId())) {}

Player RatingStore::makePlayer(PlayerId id) const {
    Player player;
    player.id = id;
    player.baselineRating = defaultBaseline_;
    player.currentRating = defaultBaseline_;
    return player;
}

const Player& RatingStore::get(PlayerId id) {
    if (!id.isValid()) {
        return unregistered_;
    }
    auto it = players_.find(id);
    if (it == players_.end()) {
        it = players_.emplace(id, makePlayer(id)).first;
    }
    return it->second;
}

const Player* RatingStore::find(PlayerId id) const {
    auto it = players_.find(id);
    return it == players_.end() ? nullptr : &it->second;
}

EngineResult<void> RatingStore::apply(const Match& match, const MatchUpdate& update) {
    if (!match.playerA.isValid() || !match.playerB.isValid()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidPlayer, "match references an invalid player id"));
    }
    if (match.playerA == match.playerB) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidPlayer,
                        "player " + std::to_string(match.playerA.value()) + " cannot play itself"));
    }
    if (match.winner != match.playerA && match.winner != match.playerB) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidPlayer, "winner is not a participant of the match"));
    }

    // Build both new states first, then commit both.
    Player a = get(match.playerA);
    Player b = get(match.playerB);

    a.currentRating += update.delta.deltaA;
    b.currentRating += update.delta.deltaB;
    a.baselineRating += baselineFraction_ * update.delta.deltaA;
    b.baselineRating += baselineFraction_ * update.delta.deltaB;
    a.formSignal = update.formA;
    b.formSignal = update.formB;
    a.lastActive = match.date;
    b.lastActive = match.date;
    ++a.matchesPlayed;
    ++b.matchesPlayed;

    players_[match.playerA] = a;
    players_[match.playerB] = b;
    return EngineResult<void>::ok();
}

RatingSnapshot RatingStore::snapshot(const Date& asOf, const RatingConfig& config) const {
    std::vector<PlayerRatingRecord> records;
    records.reserve(players_.size());
    for (const auto& [id, player] : players_) {
        PlayerRatingRecord record;
        record.id = id;
        record.baselineRating = player.baselineRating;
        record.currentRating = player.currentRating;
        record.formSignal = FormTracker::decayed(player.formSignal, player.lastActive, asOf,
                                                 config.form.halfLifeDays);
        record.effectiveRating = Blender::effectiveRating(player, asOf, config);
        record.lastActive = player.lastActive;
        record.matchesPlayed = player.matchesPlayed;
        records.push_back(std::move(record));
    }
    return RatingSnapshot(asOf, std::move(records));
}

} // namespace tre::rating
