#include "engine/gemini_collaborator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <QCoreApplication>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace clausedrift {

namespace {

void logFailure(const char *purpose, const QString &reason, const nlohmann::json &context)
{
    nlohmann::json details = context;
    details["purpose"] = purpose;
    CDLOG_WARN(QStringLiteral("GeminiCollaborator"),
               QStringLiteral("generate"),
               QStringLiteral("ai_request_failed"),
               reason,
               QStringLiteral("return_absent"),
               clausedrift::logging::defaultWho(),
               QString(),
               details);
}

std::string trim(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

} // namespace

GeminiCollaborator::GeminiCollaborator(GeminiSettings settings)
    : m_settings(std::move(settings))
{
}

std::string GeminiCollaborator::similarityPrompt(const std::string &textA,
                                                 const std::string &textB)
{
    return "Compare these two contract clauses and rate their semantic similarity "
           "on a scale of 0 to 1, where:\n"
           "- 1.0 = identical meaning, even if worded differently\n"
           "- 0.7-0.9 = very similar meaning with minor differences\n"
           "- 0.4-0.6 = somewhat similar, with notable differences\n"
           "- 0.1-0.3 = different meanings\n"
           "- 0.0 = unrelated\n\n"
           "Clause 1:\n" + textA + "\n\n"
           "Clause 2:\n" + textB + "\n\n"
           "Respond with ONLY a number between 0 and 1.";
}

std::string GeminiCollaborator::summaryPrompt(const std::string &oldText,
                                              const std::string &newText,
                                              ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Added:
        return "This clause was newly added to a contract. "
               "Summarize what it means in 1-2 sentences:\n\n" + newText;
    case ChangeKind::Removed:
        return "This clause was removed from a contract. "
               "Summarize what was removed in 1-2 sentences:\n\n" + oldText;
    case ChangeKind::Modified:
    case ChangeKind::Rewritten:
        break;
    }
    return "These two versions of a contract clause show a change. "
           "Summarize what changed in 1-2 sentences.\n\n"
           "Original:\n" + oldText + "\n\n"
           "New:\n" + newText;
}

std::string GeminiCollaborator::explanationPrompt(const std::string &clauseText,
                                                  const std::string &category,
                                                  const std::string &changeSummary)
{
    return "A contract clause in the \"" + category + "\" category has changed. "
           "Explain why this matters to a business user in 2-3 sentences, "
           "focusing on practical implications.\n\n"
           "Clause:\n" + clauseText + "\n\n"
           "Change:\n" + changeSummary;
}

std::optional<std::string> GeminiCollaborator::parseResponseText(const std::string &body)
{
    try {
        const auto payload = nlohmann::json::parse(body);
        const auto &candidates = payload.at("candidates");
        if (!candidates.is_array() || candidates.empty()) {
            return std::nullopt;
        }
        const auto &parts = candidates.at(0).at("content").at("parts");
        if (!parts.is_array() || parts.empty()) {
            return std::nullopt;
        }
        const std::string text = trim(parts.at(0).at("text").get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::optional<std::string> GeminiCollaborator::generate(const std::string &prompt,
                                                        const char *purpose)
{
    if (m_settings.apiKey.empty()) {
        return std::nullopt;
    }
    if (!QCoreApplication::instance()) {
        logFailure(purpose, QStringLiteral("no_event_loop"), nlohmann::json::object());
        return std::nullopt;
    }

    QUrl url(QString::fromStdString(m_settings.endpoint + "/models/" + m_settings.model
                                    + ":generateContent"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("key"), QString::fromStdString(m_settings.apiKey));
    url.setQuery(query);

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(static_cast<int>(m_settings.timeout.count()));

    const nlohmann::json part = {{"text", prompt}};
    const nlohmann::json content = {{"parts", nlohmann::json::array({part})}};
    nlohmann::json body;
    body["contents"] = nlohmann::json::array({content});
    body["generationConfig"] = {{"temperature", 0.0}};

    QNetworkAccessManager manager;
    QNetworkReply *reply = manager.post(request, QByteArray::fromStdString(
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    const QByteArray responseBody = reply->readAll();
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError error = reply->error();
    const QString errorString = reply->errorString();
    reply->deleteLater();

    if (error != QNetworkReply::NoError) {
        logFailure(purpose,
                   (error == QNetworkReply::OperationCanceledError
                    || error == QNetworkReply::TimeoutError)
                       ? QStringLiteral("timeout")
                       : QStringLiteral("network_error"),
                   nlohmann::json{{"status", status}, {"error", errorString.toStdString()}});
        return std::nullopt;
    }

    auto text = parseResponseText(responseBody.toStdString());
    if (!text.has_value()) {
        logFailure(purpose, QStringLiteral("malformed_response"),
                   nlohmann::json{{"status", status}, {"bytes", responseBody.size()}});
    }
    return text;
}

std::optional<double> GeminiCollaborator::similarity(const std::string &textA,
                                                     const std::string &textB)
{
    const auto reply = generate(similarityPrompt(textA, textB), "similarity");
    if (!reply.has_value()) {
        return std::nullopt;
    }

    bool ok = false;
    const double score = QString::fromStdString(*reply).trimmed().toDouble(&ok);
    if (!ok || std::isnan(score)) {
        logFailure("similarity", QStringLiteral("non_numeric_score"),
                   nlohmann::json{{"reply", *reply}});
        return std::nullopt;
    }
    return std::clamp(score, 0.0, 1.0);
}

std::optional<std::string> GeminiCollaborator::summarize(const std::string &oldText,
                                                         const std::string &newText,
                                                         ChangeKind kind)
{
    return generate(summaryPrompt(oldText, newText, kind), "summary");
}

std::optional<std::string> GeminiCollaborator::explain(const std::string &clauseText,
                                                       const std::string &category,
                                                       const std::string &changeSummary)
{
    return generate(explanationPrompt(clauseText, category, changeSummary), "explanation");
}

} // namespace clausedrift
