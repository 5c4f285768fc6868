#ifndef REPORTTYPES_H
#define REPORTTYPES_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QMetaType>

namespace ReportTypes {

    Q_NAMESPACE

    // Lifecycle of one report generation
    enum class Stage {
        Initializing,
        ProcessingData,
        GeneratingPartial,
        Finalizing,
        Completed,
        Error,
        Cancelled
    };
    Q_ENUM_NS(Stage)

    // snake_case name used in JSON payloads, e.g. "processing_data"
    QString stageName(Stage stage);
    bool isTerminal(Stage stage);
    bool isValidTransition(Stage from, Stage to);

    struct ReportError {
        QString code;
        QString message;
        Stage stage = Stage::Initializing;
        bool recoverable = false;
        int retryCount = 0;
        QJsonObject context;
        qint64 timestampMs = 0;

        QJsonObject toJson() const;
    };

    /**
     * @brief Tunables of one report generation
     *
     * Server-wide defaults come from the [Reports] configuration group; a request
     * may override any of them.
     */
    struct ReportConfig {
        int batchSize = 50;
        int maxConcurrentBatches = 3;
        int maxRetries = 3;
        int retryBaseDelayMs = 1000;
        int partialEveryBatches = 3;
        int progressIntervalMs = 2000;
        int memoryThresholdMB = 200;
        int maxMemoryMB = 256;
        bool enableErrorRecovery = true;
        int maxErrors = 3;
        int reportCacheTtlHours = 6;
        int previewActive = 20;
        int previewOthers = 10;
        bool enablePartialResults = true;
        bool useCache = true;

        // Values outside their valid range are clamped
        ReportConfig normalized() const;

        QJsonObject toJson() const;

        // Keys missing from json keep the value from defaults
        static ReportConfig fromJson(const QJsonObject& json, const ReportConfig& defaults = ReportConfig());
    };

    struct ReportRequest {
        QString guildId;
        // Role whose members are reported, empty for every known member
        QString filter;
        qint64 startMs = 0;
        qint64 endMs = 0;
        ReportConfig config;

        bool isValid() const { return !guildId.isEmpty() && startMs > 0 && endMs >= startMs; }
        QString cacheKey() const;
        QJsonObject toJson() const;
    };

    struct ReportStatistics {
        int totalMembers = 0;
        int activeMembers = 0;
        int inactiveMembers = 0;
        int afkMembers = 0;
        qint64 averageActivityMs = 0;
        qint64 processingTimeMs = 0;
        qint64 memoryPeakBytes = 0;
        int batchesProcessed = 0;
        int errorsRecovered = 0;

        QJsonObject toJson() const;
    };

}

Q_DECLARE_METATYPE(ReportTypes::ReportError)

#endif // REPORTTYPES_H
