#include "common/settings.hpp"

#include <QFile>

#include <cstdio>

#include "common/logging.hpp"

namespace timeledger {

namespace {

QString homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? QStringLiteral(".") : home;
}

} // namespace

void from_json(const nlohmann::json &j, TimeGoal &goal)
{
    goal.hours = j.value("hours", 0);
    goal.minutes = j.value("minutes", 0);
}

Settings Settings::load()
{
    return load(defaultConfigPath());
}

Settings Settings::load(const QString &configPath)
{
    Settings settings;
    settings.dataFile = defaultDataFile();

    QFile file(configPath);
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            TLOG_WARN(QStringLiteral("Settings"),
                      QStringLiteral("load"),
                      QStringLiteral("config_unreadable"),
                      file.errorString(),
                      QStringLiteral("defaults"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", configPath.toStdString()}}));
        } else {
            try {
                const auto config = nlohmann::json::parse(file.readAll().toStdString());
                if (config.contains("dataFile") && config.at("dataFile").is_string()) {
                    settings.dataFile = expandHome(
                        QString::fromStdString(config.at("dataFile").get<std::string>()));
                }
                settings.autoInsertStop = config.value("autoInsertStop", false);
                if (config.contains("timeGoal") && config.at("timeGoal").is_object()) {
                    const auto &goal = config.at("timeGoal");
                    if (goal.contains("daily")) {
                        settings.dailyGoal = goal.at("daily").get<TimeGoal>();
                    }
                    if (goal.contains("weekly")) {
                        settings.weeklyGoal = goal.at("weekly").get<TimeGoal>();
                    }
                }
            } catch (const nlohmann::json::exception &error) {
                std::fprintf(stderr, "Ignoring invalid config %s: %s\n",
                             configPath.toLocal8Bit().constData(), error.what());
                TLOG_WARN(QStringLiteral("Settings"),
                          QStringLiteral("load"),
                          QStringLiteral("config_invalid"),
                          QString::fromUtf8(error.what()),
                          QStringLiteral("defaults"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"path", configPath.toStdString()}}));
                settings = Settings{};
                settings.dataFile = defaultDataFile();
            }
        }
    }

    const QString envDataFile = qEnvironmentVariable("TIMELEDGER_DATA_FILE");
    if (!envDataFile.isEmpty()) {
        settings.dataFile = expandHome(envDataFile);
    }

    return settings;
}

QString Settings::defaultConfigPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        base = homeDir() + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/timeledger/config.json");
}

QString Settings::defaultDataFile()
{
    return homeDir() + QStringLiteral("/.local/share/timeledger/entries.jsonl");
}

QString Settings::expandHome(const QString &path)
{
    if (path == QStringLiteral("~")) {
        return homeDir();
    }
    if (path.startsWith(QStringLiteral("~/"))) {
        return homeDir() + path.mid(1);
    }
    return path;
}

} // namespace timeledger
