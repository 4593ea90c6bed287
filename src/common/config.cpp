#include "common/config.hpp"

#include <limits>

#include <QByteArray>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace clausedrift {

namespace {

void warnInvalid(const char *name, const QString &value)
{
    CDLOG_WARN(QStringLiteral("Config"),
               QStringLiteral("loadConfigFromEnvironment"),
               QStringLiteral("config_value_invalid"),
               QStringLiteral("environment"),
               QStringLiteral("keep_default"),
               clausedrift::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"variable", name}, {"value", value.toStdString()}}));
}

void readBool(const char *name, bool &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    if (value == QStringLiteral("1") || value == QStringLiteral("true")
        || value == QStringLiteral("yes")) {
        target = true;
    } else if (value == QStringLiteral("0") || value == QStringLiteral("false")
               || value == QStringLiteral("no")) {
        target = false;
    } else {
        warnInvalid(name, value);
    }
}

template <typename T>
void readNonNegative(const char *name, T &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    const QString value = qEnvironmentVariable(name).trimmed();
    bool ok = false;
    const qlonglong parsed = value.toLongLong(&ok);
    if (!ok || parsed < 0
        || static_cast<unsigned long long>(parsed)
            > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        warnInvalid(name, value);
        return;
    }
    target = static_cast<T>(parsed);
}

void readMillis(const char *name, std::chrono::milliseconds &target)
{
    qlonglong millis = target.count();
    readNonNegative(name, millis);
    target = std::chrono::milliseconds(millis);
}

void readString(const char *name, std::string &target)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    if (!value.isEmpty()) {
        target = value.toStdString();
    }
}

} // namespace

PipelineConfig loadConfigFromEnvironment()
{
    PipelineConfig config;

    readString("GEMINI_API_KEY", config.geminiApiKey);
    readString("CLAUSEDRIFT_GEMINI_MODEL", config.geminiModel);
    readString("CLAUSEDRIFT_GEMINI_ENDPOINT", config.geminiEndpoint);

    // AI assistance is on whenever a key is configured, unless switched off.
    config.aiEnabled = !config.geminiApiKey.empty();
    readBool("CLAUSEDRIFT_AI_ENABLED", config.aiEnabled);
    readBool("CLAUSEDRIFT_AI_SEMANTIC_SIMILARITY", config.aiSemanticSimilarity);
    readMillis("CLAUSEDRIFT_AI_MIN_INTERVAL_MS", config.aiMinInterval);
    readMillis("CLAUSEDRIFT_AI_TIMEOUT_MS", config.aiTimeout);

    readNonNegative("CLAUSEDRIFT_MIN_CLAUSE_WORDS", config.minClauseWords);
    readNonNegative("CLAUSEDRIFT_MAX_VOCABULARY", config.maxVocabulary);
    readNonNegative("CLAUSEDRIFT_KEYWORD_COUNT", config.keywordCount);

    if (qEnvironmentVariableIsSet("CLAUSEDRIFT_ALERT_THRESHOLD")) {
        const QString value =
            qEnvironmentVariable("CLAUSEDRIFT_ALERT_THRESHOLD").trimmed().toLower();
        const auto level = parseRiskLevelString(value.toStdString());
        if (level.has_value()) {
            config.alertThreshold = *level;
        } else {
            warnInvalid("CLAUSEDRIFT_ALERT_THRESHOLD", value);
        }
    }

    readNonNegative("CLAUSEDRIFT_WORKERS", config.workerCount);
    if (config.workerCount < 1) {
        config.workerCount = 1;
    }
    readBool("CLAUSEDRIFT_TRACE", config.traceEnabled);

    return config;
}

} // namespace clausedrift
