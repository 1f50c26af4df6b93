#pragma once

#include <QString>
#include <optional>

// Finds the player's save under a Steam-style user-data tree:
//   <root>/<account>/221680/remote/*_PRFLDB
class SaveLocator {
public:
    // Most recently modified match, or std::nullopt
    static std::optional<QString> findLatest(const QString& userDataRoot);

    static const QString s_appId;
    static const QString s_saveSuffix;
};
