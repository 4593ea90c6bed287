#include "engine/ai_call_gate.hpp"

#include <thread>
#include <utility>

namespace clausedrift {

namespace {

// Gemini free tier: 15 requests per minute.
constexpr std::chrono::milliseconds kDefaultMinInterval{4000};

} // namespace

AiCallGate::AiCallGate(std::chrono::milliseconds minInterval)
    : m_minInterval(minInterval)
{
}

AiCallGate &AiCallGate::processGate()
{
    static AiCallGate gate(kDefaultMinInterval);
    return gate;
}

void AiCallGate::setMinInterval(std::chrono::milliseconds minInterval)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minInterval = minInterval;
}

std::chrono::milliseconds AiCallGate::minInterval() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minInterval;
}

void AiCallGate::acquire()
{
    // The lock is held while sleeping so waiting callers queue up behind it.
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_lastCall.has_value()) {
        const auto nextAllowed = *m_lastCall + m_minInterval;
        if (std::chrono::steady_clock::now() < nextAllowed) {
            std::this_thread::sleep_until(nextAllowed);
        }
    }
    m_lastCall = std::chrono::steady_clock::now();
}

RateLimitedCollaborator::RateLimitedCollaborator(std::shared_ptr<AiCollaborator> inner,
                                                 AiCallGate &gate)
    : m_inner(std::move(inner))
    , m_gate(gate)
{
}

std::optional<double> RateLimitedCollaborator::similarity(const std::string &textA,
                                                          const std::string &textB)
{
    if (!m_inner) {
        return std::nullopt;
    }
    m_gate.acquire();
    return m_inner->similarity(textA, textB);
}

std::optional<std::string> RateLimitedCollaborator::summarize(const std::string &oldText,
                                                              const std::string &newText,
                                                              ChangeKind kind)
{
    if (!m_inner) {
        return std::nullopt;
    }
    m_gate.acquire();
    return m_inner->summarize(oldText, newText, kind);
}

std::optional<std::string> RateLimitedCollaborator::explain(const std::string &clauseText,
                                                            const std::string &category,
                                                            const std::string &changeSummary)
{
    if (!m_inner) {
        return std::nullopt;
    }
    m_gate.acquire();
    return m_inner->explain(clauseText, category, changeSummary);
}

} // namespace clausedrift
