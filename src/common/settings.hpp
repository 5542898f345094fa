#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace timeledger {

struct Settings {
    QString dataFile;
    bool autoInsertStop = false;
    TimeGoal dailyGoal{8, 0};
    TimeGoal weeklyGoal{40, 0};

    // Reads the config file (missing file => defaults) and applies the
    // TIMELEDGER_DATA_FILE override.
    static Settings load();
    static Settings load(const QString &configPath);

    static QString defaultConfigPath();
    static QString defaultDataFile();
    static QString expandHome(const QString &path);
};

void from_json(const nlohmann::json &j, TimeGoal &goal);

} // namespace timeledger
