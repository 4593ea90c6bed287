#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/clausedrift_version.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "engine/comparison_pipeline.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("clausedrift-report"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CLAUSEDRIFT_VERSION));

    clausedrift::PipelineConfig config = clausedrift::loadConfigFromEnvironment();
    bool trace = config.traceEnabled;
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
    config.traceEnabled = trace;
    clausedrift::logging::initLogging(QStringLiteral("clausedrift-report"), trace);
    CDLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("report_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               clausedrift::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()},
                               {"version", CLAUSEDRIFT_VERSION},
                               {"ai", config.aiEnabled}}));

    auto collaborator = clausedrift::makeConfiguredCollaborator(config);
    clausedrift::ReportCli cli(config, collaborator);
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
