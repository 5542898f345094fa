#include <QCoreApplication>
#include <QUuid>

#include "cli/LedgerCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("timeledger"));

    bool trace = qEnvironmentVariableIntValue("TIMELEDGER_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    timeledger::logging::initLogging(QStringLiteral("timeledger"), trace);
    timeledger::logging::CorrelationScope correlation(
        QUuid::createUuid().toString(QUuid::WithoutBraces));
    TLOG_DEBUG(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("ledger_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    // Single-shot command: no event loop, the CLI runs to completion.
    timeledger::LedgerCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
