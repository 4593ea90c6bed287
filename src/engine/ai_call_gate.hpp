#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "engine/ai_collaborator.hpp"

namespace clausedrift {

// Spaces out AI calls: acquire() returns no earlier than minInterval after
// the previous acquire() returned, whichever thread made it.
class AiCallGate
{
public:
    explicit AiCallGate(std::chrono::milliseconds minInterval);

    // The gate shared by every comparison running in this process.
    static AiCallGate &processGate();

    void setMinInterval(std::chrono::milliseconds minInterval);
    std::chrono::milliseconds minInterval() const;

    void acquire();

private:
    mutable std::mutex m_mutex;
    std::chrono::milliseconds m_minInterval;
    std::optional<std::chrono::steady_clock::time_point> m_lastCall;
};

// Routes every call of the wrapped collaborator through a gate.
class RateLimitedCollaborator : public AiCollaborator
{
public:
    RateLimitedCollaborator(std::shared_ptr<AiCollaborator> inner, AiCallGate &gate);

    std::optional<double> similarity(const std::string &textA,
                                     const std::string &textB) override;
    std::optional<std::string> summarize(const std::string &oldText,
                                         const std::string &newText,
                                         ChangeKind kind) override;
    std::optional<std::string> explain(const std::string &clauseText,
                                       const std::string &category,
                                       const std::string &changeSummary) override;

private:
    std::shared_ptr<AiCollaborator> m_inner;
    AiCallGate &m_gate;
};

} // namespace clausedrift
