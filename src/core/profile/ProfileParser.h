#pragma once

#include "PlayerProfile.h"
#include "../library/IdentifierMapBuilder.h"

#include <QJsonObject>

// Merges the two progress sections of a decoded save:
//   "Songs"    dynamic difficulty (DynamicDifficulty.Avg, TimeStamp)
//   "SongsSA"  score attack (Badges, PlayCount, HighScores)
// Both are keyed by the game's internal id with inconsistent casing.
class ProfileParser {
public:
    static PlayerProfile parse(const QJsonObject& root, const IdentifierMap& idMap);
};
