#include "ReportTypes.h"

#include <QJsonValue>

namespace ReportTypes {

QString stageName(Stage stage)
{
    switch (stage) {
        case Stage::Initializing:      return QStringLiteral("initializing");
        case Stage::ProcessingData:    return QStringLiteral("processing_data");
        case Stage::GeneratingPartial: return QStringLiteral("generating_partial");
        case Stage::Finalizing:        return QStringLiteral("finalizing");
        case Stage::Completed:         return QStringLiteral("completed");
        case Stage::Error:             return QStringLiteral("error");
        case Stage::Cancelled:         return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

bool isTerminal(Stage stage)
{
    return stage == Stage::Completed || stage == Stage::Error || stage == Stage::Cancelled;
}

bool isValidTransition(Stage from, Stage to)
{
    switch (from) {
        case Stage::Initializing:
            // Completed directly on a report cache hit, Finalizing for an empty member list
            return to == Stage::ProcessingData || to == Stage::Finalizing || to == Stage::Completed
                || to == Stage::Error || to == Stage::Cancelled;
        case Stage::ProcessingData:
            return to == Stage::GeneratingPartial || to == Stage::Finalizing
                || to == Stage::Error || to == Stage::Cancelled;
        case Stage::GeneratingPartial:
            return to == Stage::ProcessingData || to == Stage::Error || to == Stage::Cancelled;
        case Stage::Finalizing:
            return to == Stage::Completed || to == Stage::Error;
        case Stage::Completed:
        case Stage::Error:
        case Stage::Cancelled:
            return false;
    }
    return false;
}

QJsonObject ReportError::toJson() const
{
    QJsonObject json;
    json["code"] = code;
    json["message"] = message;
    json["stage"] = stageName(stage);
    json["recoverable"] = recoverable;
    json["retryCount"] = retryCount;
    json["context"] = context;
    json["timestamp"] = timestampMs;
    return json;
}

ReportConfig ReportConfig::normalized() const
{
    ReportConfig config = *this;
    config.batchSize = qBound(1, batchSize, 1000);
    config.maxConcurrentBatches = qBound(1, maxConcurrentBatches, 32);
    config.maxRetries = qBound(0, maxRetries, 10);
    config.retryBaseDelayMs = qBound(0, retryBaseDelayMs, 60000);
    config.partialEveryBatches = qMax(1, partialEveryBatches);
    config.progressIntervalMs = qMax(0, progressIntervalMs);
    config.memoryThresholdMB = qMax(1, memoryThresholdMB);
    config.maxMemoryMB = qMax(config.memoryThresholdMB, maxMemoryMB);
    config.maxErrors = qMax(0, maxErrors);
    config.reportCacheTtlHours = qBound(2, reportCacheTtlHours, 6);
    config.previewActive = qMax(0, previewActive);
    config.previewOthers = qMax(0, previewOthers);
    return config;
}

QJsonObject ReportConfig::toJson() const
{
    QJsonObject json;
    json["batchSize"] = batchSize;
    json["maxConcurrentBatches"] = maxConcurrentBatches;
    json["maxRetries"] = maxRetries;
    json["retryBaseDelayMs"] = retryBaseDelayMs;
    json["partialEveryBatches"] = partialEveryBatches;
    json["progressIntervalMs"] = progressIntervalMs;
    json["memoryThresholdMB"] = memoryThresholdMB;
    json["maxMemoryMB"] = maxMemoryMB;
    json["enableErrorRecovery"] = enableErrorRecovery;
    json["maxErrors"] = maxErrors;
    json["reportCacheTtlHours"] = reportCacheTtlHours;
    json["previewActive"] = previewActive;
    json["previewOthers"] = previewOthers;
    json["enablePartialResults"] = enablePartialResults;
    json["useCache"] = useCache;
    return json;
}

ReportConfig ReportConfig::fromJson(const QJsonObject& json, const ReportConfig& defaults)
{
    ReportConfig config = defaults;
    config.batchSize = json.value("batchSize").toInt(defaults.batchSize);
    config.maxConcurrentBatches = json.value("maxConcurrentBatches").toInt(defaults.maxConcurrentBatches);
    config.maxRetries = json.value("maxRetries").toInt(defaults.maxRetries);
    config.retryBaseDelayMs = json.value("retryBaseDelayMs").toInt(defaults.retryBaseDelayMs);
    config.partialEveryBatches = json.value("partialEveryBatches").toInt(defaults.partialEveryBatches);
    config.progressIntervalMs = json.value("progressIntervalMs").toInt(defaults.progressIntervalMs);
    config.memoryThresholdMB = json.value("memoryThresholdMB").toInt(defaults.memoryThresholdMB);
    config.maxMemoryMB = json.value("maxMemoryMB").toInt(defaults.maxMemoryMB);
    config.enableErrorRecovery = json.value("enableErrorRecovery").toBool(defaults.enableErrorRecovery);
    config.maxErrors = json.value("maxErrors").toInt(defaults.maxErrors);
    config.reportCacheTtlHours = json.value("reportCacheTtlHours").toInt(defaults.reportCacheTtlHours);
    config.previewActive = json.value("previewActive").toInt(defaults.previewActive);
    config.previewOthers = json.value("previewOthers").toInt(defaults.previewOthers);
    config.enablePartialResults = json.value("enablePartialResults").toBool(defaults.enablePartialResults);
    config.useCache = json.value("useCache").toBool(defaults.useCache);
    return config.normalized();
}

QString ReportRequest::cacheKey() const
{
    return QString("report_%1_%2_%3_%4").arg(guildId, filter.isEmpty() ? QStringLiteral("all") : filter)
        .arg(startMs).arg(endMs);
}

QJsonObject ReportRequest::toJson() const
{
    QJsonObject json;
    json["guildId"] = guildId;
    json["filter"] = filter;
    json["startTime"] = startMs;
    json["endTime"] = endMs;
    return json;
}

QJsonObject ReportStatistics::toJson() const
{
    QJsonObject json;
    json["totalMembers"] = totalMembers;
    json["activeMembers"] = activeMembers;
    json["inactiveMembers"] = inactiveMembers;
    json["afkMembers"] = afkMembers;
    json["averageActivityMs"] = averageActivityMs;
    json["processingTimeMs"] = processingTimeMs;
    json["memoryPeakBytes"] = memoryPeakBytes;
    json["batchesProcessed"] = batchesProcessed;
    json["errorsRecovered"] = errorsRecovered;
    return json;
}

}
