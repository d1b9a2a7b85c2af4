#include "core/consensus/coding_rate.h"
#include "core/store/sqlite_store.h"
#include "core/shared/logging.h"

namespace vmc {

int CoderRate::totalCodes() const
{
    int total = 0;
    for (const CodingSession& session : sessions) {
        total += session.codeCount;
    }
    return total;
}

double CoderRate::codesPerHour() const
{
    double seconds = 0.0;
    for (const CodingSession& session : sessions) {
        seconds += session.durationSeconds;
    }
    if (seconds <= 0.0) {
        return 0.0;
    }
    return totalCodes() * 3600.0 / seconds;
}

CodingRateAnalyzer::CodingRateAnalyzer(SQLiteStore& store)
    : m_store(store)
{
}

std::vector<CoderRate> CodingRateAnalyzer::sessionize(const std::vector<CodingRow>& codes,
                                                      double maxSessionPauseSeconds)
{
    std::vector<CoderRate> rates;
    double sessionStart = 0.0;
    double lastCode = 0.0;

    for (const CodingRow& code : codes) {
        const bool newCoder = rates.empty() || rates.back().coderId != code.coderId;
        if (newCoder) {
            CoderRate rate;
            rate.coderId = code.coderId;
            rate.coderName = code.coderName;
            rates.push_back(rate);
        }

        CoderRate& rate = rates.back();
        if (newCoder || code.addedAt - lastCode > maxSessionPauseSeconds) {
            CodingSession session;
            session.startedAt = code.addedAt;
            rate.sessions.push_back(session);
            sessionStart = code.addedAt;
        }

        CodingSession& session = rate.sessions.back();
        ++session.codeCount;
        session.durationSeconds = code.addedAt - sessionStart;
        lastCode = code.addedAt;
    }
    return rates;
}

std::optional<std::vector<CoderRate>> CodingRateAnalyzer::analyze(std::optional<double> from,
                                                                  std::optional<double> to,
                                                                  int64_t maxSessionPauseSeconds)
{
    if (maxSessionPauseSeconds <= 0) {
        LOG_WARN(vmcConsensus, "analyze: session pause must be positive (got %lld)",
                 static_cast<long long>(maxSessionPauseSeconds));
        return std::nullopt;
    }

    const auto codes = m_store.codingTimeline(from, to);
    if (!codes.has_value()) {
        LOG_ERROR(vmcConsensus, "analyze: could not load coding timeline");
        return std::nullopt;
    }

    std::vector<CoderRate> rates =
        sessionize(*codes, static_cast<double>(maxSessionPauseSeconds));
    LOG_INFO(vmcConsensus, "Coding rate: %d codes from %d coders",
             static_cast<int>(codes->size()), static_cast<int>(rates.size()));
    return rates;
}

} // namespace vmc
