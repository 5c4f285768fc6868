#ifndef REPORTENGINE_H
#define REPORTENGINE_H

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QThreadPool>
#include <functional>
#include <memory>
#include <optional>

#include "ReportTypes.h"
#include "MemberDirectory.h"
#include "UserClassificationService.h"
#include "cache/fallbackcache.h"

class ActivitySource;
class ReportCacheRepository;

/**
 * @brief Batched report generation over aggregated activity
 *
 * Each generateReport() call becomes an operation identified by a UUID. A
 * coordinator thread partitions the member list into fixed-size batches and
 * admits at most maxConcurrentBatches of them to the worker pool at a time,
 * waiting on a completion queue before admitting the next one. Failed batches
 * are retried with exponential backoff; once retries are exhausted the batch is
 * recorded as an error and the operation continues while it stays within the
 * error budget.
 *
 * Progress, partial results and the terminal completed / failed / cancelled
 * signal are always emitted from the thread that owns the engine. Finished
 * reports are stored in the shared cache and in the report_cache table, and are
 * served from there while they are valid.
 */
class ReportEngine : public QObject
{
    Q_OBJECT
public:
    using MemorySampler = std::function<qint64()>;

    // Finished operation contexts older than this are dropped by a cleanup pass
    static constexpr qint64 StaleContextAgeMs = 60 * 60 * 1000;

    ReportEngine(ActivitySource* source, MemberDirectory* directory, UserClassificationService* classifier,
                 std::shared_ptr<Cache::FallbackCache> cache, ReportCacheRepository* reportCache,
                 const ReportTypes::ReportConfig& defaults = ReportTypes::ReportConfig(),
                 QObject* parent = nullptr);
    ~ReportEngine() override;

    /**
     * @brief Start generating a report
     *
     * Must be called from the engine's thread. Returns immediately; the outcome
     * arrives through the signals below.
     * @return Operation id, or an empty string when the request is invalid
     */
    QString generateReport(const ReportTypes::ReportRequest& request);

    // Requests cancellation; false for unknown or already finishing operations
    bool cancelReport(const QString& operationId);

    std::optional<QJsonObject> operationStatus(const QString& operationId) const;

    QJsonObject memoryStats() const;
    int activeOperations() const;

    ReportTypes::ReportConfig defaultConfig() const;
    void setDefaultConfig(const ReportTypes::ReportConfig& config);

    void setMemorySampler(MemorySampler sampler);

    /**
     * @brief Drop finished operation contexts and expired local cache entries
     * @return Number of operation contexts removed
     */
    int cleanupStaleOperations(qint64 nowMs = -1);

    // Blocks until no operation is running
    bool waitForIdle(int timeoutMs = -1);

    // Resident set size of this process, 0 where it cannot be read
    static qint64 processResidentBytes();

signals:
    void progress(const QString& operationId, const QJsonObject& progress);
    void partialResult(const QString& operationId, const QJsonObject& partial);
    void completed(const QString& operationId, const QJsonObject& result);
    void failed(const QString& operationId, const QJsonObject& error, const QJsonObject& partial);
    void cancelled(const QString& operationId, const QJsonObject& partial);
    void memoryWarning(const QString& operationId, qint64 currentBytes, qint64 thresholdBytes);

private:
    struct Operation;
    struct BatchOutcome;
    class CompletionQueue;

    void runOperation(const std::shared_ptr<Operation>& op);
    BatchOutcome processBatch(const std::shared_ptr<Operation>& op, const QList<MemberInfo>& members,
                              int batchNumber);
    bool sleepUnlessCancelled(const std::shared_ptr<Operation>& op, qint64 delayMs) const;

    bool transition(const std::shared_ptr<Operation>& op, ReportTypes::Stage to);
    void publishProgress(const std::shared_ptr<Operation>& op, int current, int total,
                         int itemsProcessed, const QString& message);
    QJsonObject buildPayload(const std::shared_ptr<Operation>& op, const ClassificationResult& classification,
                             const ReportTypes::ReportStatistics& statistics, bool success) const;

    std::optional<QJsonObject> lookupCachedReport(const QString& cacheKey);
    void storeReport(const std::shared_ptr<Operation>& op, const QJsonObject& result);

    qint64 sampleMemory();
    std::shared_ptr<Operation> findOperation(const QString& operationId) const;

    // Runs fn on the engine's thread
    void post(std::function<void()> fn);

    ActivitySource* m_source;
    MemberDirectory* m_directory;
    UserClassificationService* m_classifier;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    ReportCacheRepository* m_reportCache;
    ReportTypes::ReportConfig m_defaults;
    MemorySampler m_memorySampler;

    QThreadPool m_coordinators;
    QThreadPool m_workers;

    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<Operation>> m_operations;
    qint64 m_currentBytes;
    qint64 m_peakBytes;
    int m_cleanupCount;
};

#endif // REPORTENGINE_H
