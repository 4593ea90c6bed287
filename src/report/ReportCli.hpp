#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"
#include "engine/ai_collaborator.hpp"

namespace clausedrift {

class ReportCli
{
public:
    // Uses the environment configuration and no AI collaborator.
    ReportCli();
    ReportCli(PipelineConfig config, std::shared_ptr<AiCollaborator> collaborator);

    // CLI dispatcher for comparison and segmentation reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runCompareReport(const QStringList &args);
    int runSegmentReport(const QStringList &args);

    // Applies --min-words and --alert-threshold; false on a malformed value.
    bool applyOverrides(const QStringList &args, PipelineConfig &config) const;

    std::optional<std::string> readTextFile(const QString &path) const;
    std::optional<std::vector<SectionHint>> readSectionsFile(const QString &path) const;

    PipelineConfig m_config;
    std::shared_ptr<AiCollaborator> m_collaborator;
};

} // namespace clausedrift
