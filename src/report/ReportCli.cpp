#include "report/ReportCli.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <QFile>
#include <QFileInfo>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/change_explainer.hpp"
#include "engine/comparison_pipeline.hpp"
#include "engine/fingerprint_engine.hpp"

namespace clausedrift {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  clausedrift-report compare --old PATH --new PATH [--old-sections PATH]\n"
        "                     [--new-sections PATH] [--format markdown|json]\n"
        "                     [--min-words N] [--alert-threshold low|medium|high|critical]\n"
        "  clausedrift-report segment --input PATH [--sections PATH]\n"
        "                     [--format markdown|json] [--min-words N]\n"
        "Options:\n"
        "  --trace   write detailed trace logs\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isKnownFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::string formatSimilarity(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

std::string clauseTitle(const Clause &clause)
{
    std::string title = "Clause " + std::to_string(clause.number);
    if (clause.heading.has_value()) {
        title += ": " + *clause.heading;
    }
    return title;
}

std::string joinWords(const std::vector<std::string> &words, std::size_t limit)
{
    std::string joined;
    const std::size_t shown = std::min(words.size(), limit);
    for (std::size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += words[i];
    }
    if (words.size() > shown) {
        joined += " (+" + std::to_string(words.size() - shown) + " more)";
    }
    return joined;
}

void renderCompareMarkdown(const ComparisonResult &result)
{
    const ComparisonStats &stats = result.stats;
    std::cout << "# ClauseDrift Comparison Report\n\n";
    std::cout << "Old version: " << result.oldVersionId << "\n";
    std::cout << "New version: " << result.newVersionId << "\n";
    std::cout << "Clauses: " << stats.oldClauses << " -> " << stats.newClauses << "\n";
    std::cout << "Changes: " << stats.changesDetected << " (" << stats.added << " added, "
              << stats.removed << " removed, " << stats.modified << " modified, "
              << stats.rewritten << " rewritten)\n";
    std::cout << "Alerts: " << stats.alerts << "\n\n";
    std::cout << "## Changes\n\n";

    if (result.changes.empty()) {
        std::cout << "No clause changes between versions.\n";
        return;
    }

    for (const auto &change : result.changes) {
        const Clause *subject = change.subjectClause();
        std::cout << "### " << (change.alert ? "[ALERT] " : "")
                  << toChangeKindString(change.kind) << ": "
                  << (subject ? clauseTitle(*subject) : std::string("unknown clause"));
        if (subject && subject->category.has_value()) {
            std::cout << " (" << toCategoryString(*subject->category) << ")";
        }
        std::cout << "\n\n";
        std::cout << "- Risk: " << toRiskLevelString(change.riskLevel) << " ("
                  << change.riskScore << "/100)\n";
        if (change.magnitude.has_value()) {
            std::cout << "- Similarity: " << formatSimilarity(change.similarity) << " ("
                      << toMagnitudeString(*change.magnitude) << ")\n";
        }
        if (change.wordDiff.has_value()) {
            const WordDiff &diff = *change.wordDiff;
            if (!diff.addedWords.empty()) {
                std::cout << "- Words added: " << joinWords(diff.addedWords, 12) << "\n";
            }
            if (!diff.removedWords.empty()) {
                std::cout << "- Words removed: " << joinWords(diff.removedWords, 12) << "\n";
            }
        }
        if (change.semanticSimilarity.has_value()) {
            std::cout << "- Semantic similarity: "
                      << formatSimilarity(*change.semanticSimilarity) << "\n";
        }
        if (change.summary.has_value()) {
            std::cout << "- Summary: " << *change.summary << "\n";
        }
        std::cout << "- Explanation: " << change.explanation << "\n\n";
    }
}

void renderCompareJson(const ComparisonResult &result)
{
    const nlohmann::json payload = result;
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

void renderSegmentMarkdown(const QString &inputPath,
                           const std::vector<FingerprintedClause> &clauses)
{
    std::cout << "# ClauseDrift Segmentation Report\n\n";
    std::cout << "Input: " << inputPath.toStdString() << "\n";
    std::cout << "Clauses: " << clauses.size() << "\n\n";

    if (clauses.empty()) {
        std::cout << "No clauses found.\n";
        return;
    }

    for (const auto &entry : clauses) {
        const Clause &clause = entry.clause;
        std::cout << "## " << clauseTitle(clause) << "\n\n";
        std::cout << "- Category: " << categoryLabel(clause.category) << "\n";
        std::cout << "- Words: " << clause.wordCount << "\n";
        std::cout << "- Span: " << clause.spanStart << ".." << clause.spanEnd << "\n";
        std::cout << "- Edit hash: " << toEditHashString(entry.fingerprint.editHash) << "\n";
        if (!entry.fingerprint.keywords.empty()) {
            std::vector<std::string> keywords;
            for (const auto &[keyword, weight] : entry.fingerprint.keywords) {
                keywords.push_back(keyword);
            }
            std::cout << "- Keywords: " << joinWords(keywords, keywords.size()) << "\n";
        }
        std::cout << "\n";
    }
}

void renderSegmentJson(const QString &inputPath,
                       const std::vector<FingerprintedClause> &clauses)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto &entry : clauses) {
        nlohmann::json item = entry.clause;
        item["fingerprint"] = entry.fingerprint;
        entries.push_back(std::move(item));
    }
    nlohmann::json payload;
    payload["input"] = inputPath.toStdString();
    payload["totalClauses"] = clauses.size();
    payload["clauses"] = std::move(entries);
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace

ReportCli::ReportCli()
    : ReportCli(loadConfigFromEnvironment(), nullptr)
{
}

ReportCli::ReportCli(PipelineConfig config, std::shared_ptr<AiCollaborator> collaborator)
    : m_config(std::move(config))
    , m_collaborator(std::move(collaborator))
{
}

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        args.push_back(arg);
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    CDLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               clausedrift::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});
    if (command == QStringLiteral("compare")) {
        return runCompareReport(args);
    }
    if (command == QStringLiteral("segment")) {
        return runSegmentReport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runCompareReport(const QStringList &args)
{
    const QString oldPath = getArgValue(args, QStringLiteral("--old"));
    const QString newPath = getArgValue(args, QStringLiteral("--new"));
    if (oldPath.isEmpty() || newPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    PipelineConfig config = m_config;
    if (!applyOverrides(args, config)) {
        return 1;
    }

    DocumentVersion oldVersion;
    DocumentVersion newVersion;
    oldVersion.id = QFileInfo(oldPath).fileName().toStdString();
    newVersion.id = QFileInfo(newPath).fileName().toStdString();

    const auto oldText = readTextFile(oldPath);
    const auto newText = readTextFile(newPath);
    if (!oldText.has_value() || !newText.has_value()) {
        std::cerr << "Cannot read input file." << std::endl;
        return 1;
    }
    oldVersion.text = *oldText;
    newVersion.text = *newText;

    const QString oldSections = getArgValue(args, QStringLiteral("--old-sections"));
    if (!oldSections.isEmpty()) {
        const auto hints = readSectionsFile(oldSections);
        if (!hints.has_value()) {
            std::cerr << "Invalid sections file: " << oldSections.toStdString() << std::endl;
            return 1;
        }
        oldVersion.sections = *hints;
    }
    const QString newSections = getArgValue(args, QStringLiteral("--new-sections"));
    if (!newSections.isEmpty()) {
        const auto hints = readSectionsFile(newSections);
        if (!hints.has_value()) {
            std::cerr << "Invalid sections file: " << newSections.toStdString() << std::endl;
            return 1;
        }
        newVersion.sections = *hints;
    }

    ComparisonResult result;
    try {
        const ComparisonPipeline pipeline(config, m_collaborator);
        result = pipeline.compare(oldVersion, newVersion);
    } catch (const std::invalid_argument &error) {
        std::cerr << "Cannot compare: " << error.what() << std::endl;
        return 1;
    }

    CDLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runCompareReport"),
               QStringLiteral("report_compare"),
               QStringLiteral("user_invocation"),
               QStringLiteral("pipeline"),
               clausedrift::logging::defaultWho(),
               QString(),
               nlohmann::json{{"changes", result.stats.changesDetected},
                              {"alerts", result.stats.alerts},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        renderCompareJson(result);
    } else {
        renderCompareMarkdown(result);
    }
    return 0;
}

int ReportCli::runSegmentReport(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    PipelineConfig config = m_config;
    if (!applyOverrides(args, config)) {
        return 1;
    }

    DocumentVersion version;
    version.id = QFileInfo(inputPath).fileName().toStdString();
    const auto text = readTextFile(inputPath);
    if (!text.has_value()) {
        std::cerr << "Cannot read input file." << std::endl;
        return 1;
    }
    version.text = *text;

    const QString sectionsPath = getArgValue(args, QStringLiteral("--sections"));
    if (!sectionsPath.isEmpty()) {
        const auto hints = readSectionsFile(sectionsPath);
        if (!hints.has_value()) {
            std::cerr << "Invalid sections file: " << sectionsPath.toStdString() << std::endl;
            return 1;
        }
        version.sections = *hints;
    }

    std::vector<Clause> clauses;
    const ComparisonPipeline pipeline(config, nullptr);
    try {
        clauses = pipeline.segmentVersion(version);
    } catch (const std::invalid_argument &error) {
        std::cerr << "Cannot segment: " << error.what() << std::endl;
        return 1;
    }

    std::vector<std::string> texts;
    texts.reserve(clauses.size());
    for (const auto &clause : clauses) {
        texts.push_back(clause.text);
    }
    const auto fingerprints = pipeline.fingerprintEngine().fingerprintBatch(texts);

    std::vector<FingerprintedClause> fingerprinted;
    fingerprinted.reserve(clauses.size());
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        fingerprinted.push_back({clauses[i], fingerprints[i]});
    }

    CDLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runSegmentReport"),
               QStringLiteral("report_segment"),
               QStringLiteral("user_invocation"),
               QStringLiteral("segmenter"),
               clausedrift::logging::defaultWho(),
               QString(),
               nlohmann::json{{"clauses", fingerprinted.size()},
                              {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        renderSegmentJson(inputPath, fingerprinted);
    } else {
        renderSegmentMarkdown(inputPath, fingerprinted);
    }
    return 0;
}

bool ReportCli::applyOverrides(const QStringList &args, PipelineConfig &config) const
{
    const QString minWords = getArgValue(args, QStringLiteral("--min-words"));
    if (!minWords.isEmpty()) {
        bool ok = false;
        const int value = minWords.toInt(&ok);
        if (!ok || value < 0) {
            std::cerr << "Invalid --min-words value: " << minWords.toStdString() << std::endl;
            return false;
        }
        config.minClauseWords = value;
    }

    const QString threshold = getArgValue(args, QStringLiteral("--alert-threshold"));
    if (!threshold.isEmpty()) {
        const auto level = parseRiskLevelString(threshold.toLower().toStdString());
        if (!level.has_value()) {
            std::cerr << "Invalid --alert-threshold. Use low, medium, high or critical."
                      << std::endl;
            return false;
        }
        config.alertThreshold = *level;
    }
    return true;
}

std::optional<std::string> ReportCli::readTextFile(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        CDLOG_WARN(QStringLiteral("ReportCli"),
                   QStringLiteral("readTextFile"),
                   QStringLiteral("input_open_failed"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("qfile"),
                   clausedrift::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()},
                                  {"error", file.errorString().toStdString()}});
        return std::nullopt;
    }
    return file.readAll().toStdString();
}

std::optional<std::vector<SectionHint>> ReportCli::readSectionsFile(const QString &path) const
{
    const auto data = readTextFile(path);
    if (!data.has_value()) {
        return std::nullopt;
    }
    try {
        const auto parsed = nlohmann::json::parse(*data);
        if (!parsed.is_array()) {
            return std::nullopt;
        }
        return parsed.get<std::vector<SectionHint>>();
    } catch (const nlohmann::json::exception &error) {
        CDLOG_WARN(QStringLiteral("ReportCli"),
                   QStringLiteral("readSectionsFile"),
                   QStringLiteral("sections_parse_failed"),
                   QStringLiteral("user_invocation"),
                   QStringLiteral("json_parse"),
                   clausedrift::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()},
                                  {"error", error.what()}});
        return std::nullopt;
    }
}

} // namespace clausedrift
