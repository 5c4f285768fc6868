#include "ReportEngine.h"
#include "ActivitySource.h"
#include "Repositories/ReportCacheRepository.h"
#include "Models/ReportCacheModel.h"
#include "logger/logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QQueue>
#include <QThread>
#include <QUuid>
#include <QWaitCondition>
#include <utility>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

using namespace ReportTypes;

struct ReportEngine::Operation {
    QString id;
    ReportRequest request;
    ReportConfig config;
    double minHours = UserClassificationService::DefaultMinHours;
    QAtomicInt cancelRequested;

    mutable QMutex mutex;
    Stage stage = Stage::Initializing;
    qint64 startedAtMs = 0;
    qint64 finishedAtMs = 0;
    bool fromCache = false;
    QJsonObject lastProgress;
    QJsonObject result;
    std::optional<ReportError> error;
    QList<ReportError> batchErrors;
    ReportStatistics statistics;

    bool isCancelled() const { return cancelRequested.loadRelaxed() != 0; }
};

struct ReportEngine::BatchOutcome {
    int batchNumber = 0;
    int memberCount = 0;
    bool success = false;
    bool cancelled = false;
    int attempts = 0;
    QString errorMessage;
    qint64 elapsedMs = 0;
    ClassificationResult classification;
};

// Workers push finished batches, the coordinator blocks on take()
class ReportEngine::CompletionQueue
{
public:
    void push(BatchOutcome outcome)
    {
        QMutexLocker locker(&m_mutex);
        m_outcomes.enqueue(std::move(outcome));
        m_ready.wakeAll();
    }

    BatchOutcome take()
    {
        QMutexLocker locker(&m_mutex);
        while (m_outcomes.isEmpty()) {
            m_ready.wait(&m_mutex);
        }
        return m_outcomes.dequeue();
    }

private:
    QMutex m_mutex;
    QWaitCondition m_ready;
    QQueue<BatchOutcome> m_outcomes;
};

namespace {

ReportError makeError(const QString& code, const QString& message, Stage stage, bool recoverable,
                      const QJsonObject& context = QJsonObject(), int retryCount = 0)
{
    ReportError error;
    error.code = code;
    error.message = message;
    error.stage = stage;
    error.recoverable = recoverable;
    error.retryCount = retryCount;
    error.context = context;
    error.timestampMs = QDateTime::currentMSecsSinceEpoch();
    return error;
}

ReportStatistics statisticsFor(const ClassificationResult& classification, int totalMembers)
{
    ReportStatistics statistics;
    statistics.totalMembers = totalMembers;
    statistics.activeMembers = classification.active.size();
    statistics.inactiveMembers = classification.inactive.size();
    statistics.afkMembers = classification.afk.size();

    qint64 activeTotal = 0;
    for (const MemberActivity& member : classification.active) {
        activeTotal += member.totalTimeMs;
    }
    statistics.averageActivityMs = classification.active.isEmpty() ? 0 : activeTotal / classification.active.size();
    return statistics;
}

}

ReportEngine::ReportEngine(ActivitySource* source, MemberDirectory* directory, UserClassificationService* classifier,
                           std::shared_ptr<Cache::FallbackCache> cache, ReportCacheRepository* reportCache,
                           const ReportConfig& defaults, QObject* parent)
    : QObject(parent)
    , m_source(source)
    , m_directory(directory)
    , m_classifier(classifier)
    , m_cache(std::move(cache))
    , m_reportCache(reportCache)
    , m_defaults(defaults.normalized())
    , m_memorySampler(&ReportEngine::processResidentBytes)
    , m_currentBytes(0)
    , m_peakBytes(0)
    , m_cleanupCount(0)
{
    // Several operations may run at once, each bounded by its own coordinator
    m_coordinators.setMaxThreadCount(4);
    m_workers.setMaxThreadCount(qMax(QThread::idealThreadCount(), m_defaults.maxConcurrentBatches * 2));

    LOG_INFO(QString("ReportEngine created (batch size %1, %2 concurrent batches, %3 worker threads)")
            .arg(m_defaults.batchSize).arg(m_defaults.maxConcurrentBatches).arg(m_workers.maxThreadCount()));
}

ReportEngine::~ReportEngine()
{
    {
        QMutexLocker locker(&m_mutex);
        for (const auto& op : std::as_const(m_operations)) {
            op->cancelRequested.storeRelaxed(1);
        }
    }
    m_coordinators.waitForDone();
    m_workers.waitForDone();
    LOG_INFO("ReportEngine destroyed");
}

ReportConfig ReportEngine::defaultConfig() const
{
    return m_defaults;
}

void ReportEngine::setDefaultConfig(const ReportConfig& config)
{
    m_defaults = config.normalized();
    m_workers.setMaxThreadCount(qMax(m_workers.maxThreadCount(), m_defaults.maxConcurrentBatches * 2));
}

void ReportEngine::setMemorySampler(MemorySampler sampler)
{
    m_memorySampler = std::move(sampler);
}

void ReportEngine::post(std::function<void()> fn)
{
    QMetaObject::invokeMethod(this, std::move(fn), Qt::QueuedConnection);
}

std::shared_ptr<ReportEngine::Operation> ReportEngine::findOperation(const QString& operationId) const
{
    QMutexLocker locker(&m_mutex);
    return m_operations.value(operationId);
}

QString ReportEngine::generateReport(const ReportRequest& request)
{
    if (!request.isValid()) {
        LOG_WARNING(QString("Rejected report request for guild '%1' with range %2..%3")
                   .arg(request.guildId).arg(request.startMs).arg(request.endMs));
        return QString();
    }

    auto op = std::make_shared<Operation>();
    op->id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    op->request = request;
    op->config = request.config.normalized();
    op->startedAtMs = QDateTime::currentMSecsSinceEpoch();
    // Settings reads go through the cache, which is bound to this thread
    op->minHours = m_classifier->minHoursForRole(request.guildId, request.filter);

    {
        QMutexLocker locker(&m_mutex);
        m_operations.insert(op->id, op);
    }

    LOG_INFO(QString("Report %1 started for guild %2, filter '%3'")
            .arg(op->id, request.guildId, request.filter));
    publishProgress(op, 0, 0, 0, QStringLiteral("Report generation started"));

    if (op->config.useCache) {
        const std::optional<QJsonObject> cached = lookupCachedReport(request.cacheKey());
        if (cached) {
            QJsonObject result = *cached;
            result["operationId"] = op->id;
            result["fromCache"] = true;

            transition(op, Stage::Completed);
            {
                QMutexLocker locker(&op->mutex);
                op->fromCache = true;
                op->result = result;
                op->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
            }
            LOG_INFO(QString("Report %1 served from cache key %2").arg(op->id, request.cacheKey()));

            const QString id = op->id;
            post([this, id, result]() { emit completed(id, result); });
            return op->id;
        }
    }

    m_coordinators.start([this, op]() { runOperation(op); });
    return op->id;
}

bool ReportEngine::cancelReport(const QString& operationId)
{
    const std::shared_ptr<Operation> op = findOperation(operationId);
    if (!op) {
        LOG_DEBUG(QString("Cancel requested for unknown report %1").arg(operationId));
        return false;
    }

    QMutexLocker locker(&op->mutex);
    if (isTerminal(op->stage) || op->stage == Stage::Finalizing) {
        LOG_DEBUG(QString("Report %1 is already %2, not cancelled").arg(operationId, stageName(op->stage)));
        return false;
    }

    op->cancelRequested.storeRelaxed(1);
    LOG_INFO(QString("Cancellation requested for report %1").arg(operationId));
    return true;
}

bool ReportEngine::transition(const std::shared_ptr<Operation>& op, Stage to)
{
    QMutexLocker locker(&op->mutex);
    if (!isValidTransition(op->stage, to)) {
        LOG_WARNING(QString("Report %1: invalid stage change %2 -> %3")
                   .arg(op->id, stageName(op->stage), stageName(to)));
        return false;
    }

    LOG_DEBUG(QString("Report %1: %2 -> %3").arg(op->id, stageName(op->stage), stageName(to)));
    op->stage = to;
    if (isTerminal(to)) {
        op->finishedAtMs = QDateTime::currentMSecsSinceEpoch();
    }
    return true;
}

void ReportEngine::publishProgress(const std::shared_ptr<Operation>& op, int current, int total,
                                   int itemsProcessed, const QString& message)
{
    QJsonObject json;
    json["operationId"] = op->id;
    json["current"] = current;
    json["total"] = total;
    json["itemsProcessed"] = itemsProcessed;
    json["message"] = message;

    {
        QMutexLocker locker(&op->mutex);
        const qint64 elapsedMs = QDateTime::currentMSecsSinceEpoch() - op->startedAtMs;
        int percentage = 0;
        switch (op->stage) {
            case Stage::Finalizing:
                percentage = 95;
                break;
            case Stage::Completed:
                percentage = 100;
                break;
            default:
                // The last 10% is reserved for finalizing
                percentage = total > 0 ? (current * 90) / total : 0;
                break;
        }

        json["stage"] = stageName(op->stage);
        json["percentage"] = percentage;
        json["elapsedMs"] = elapsedMs;
        json["processingRate"] = elapsedMs > 0 ? (itemsProcessed * 1000.0) / elapsedMs : 0.0;
        if (current > 0 && total > current) {
            json["estimatedTimeRemainingMs"] = (elapsedMs / current) * (total - current);
        }
        json["hasPartialResults"] = op->statistics.batchesProcessed >= op->config.partialEveryBatches;
        op->lastProgress = json;
    }

    const QString id = op->id;
    post([this, id, json]() { emit progress(id, json); });
}

void ReportEngine::runOperation(const std::shared_ptr<Operation>& op)
{
    const ReportConfig& config = op->config;
    const ReportRequest& request = op->request;
    QElapsedTimer runTimer;
    runTimer.start();

    QList<MemberInfo> members;
    try {
        members = m_directory->membersWithRole(request.guildId, request.filter);
    } catch (const std::exception& ex) {
        QJsonObject context;
        context["guildId"] = request.guildId;
        context["filter"] = request.filter;
        const ReportError error = makeError("MEMBER_LOOKUP_FAILED", QString::fromUtf8(ex.what()),
                                            Stage::Initializing, false, context);
        LOG_ERROR(QString("Report %1: member lookup failed: %2").arg(op->id, error.message));

        transition(op, Stage::Error);
        const QJsonObject partial = buildPayload(op, ClassificationResult(), ReportStatistics(), false);
        {
            QMutexLocker locker(&op->mutex);
            op->error = error;
            op->result = partial;
        }
        const QString id = op->id;
        const QJsonObject errorJson = error.toJson();
        post([this, id, errorJson, partial]() { emit failed(id, errorJson, partial); });
        return;
    }

    QList<QList<MemberInfo>> batches;
    for (int i = 0; i < members.size(); i += config.batchSize) {
        batches.append(members.mid(i, config.batchSize));
    }
    const int totalBatches = batches.size();

    LOG_INFO(QString("Report %1: %2 members in %3 batches").arg(op->id).arg(members.size()).arg(totalBatches));

    auto queue = std::make_shared<CompletionQueue>();
    ClassificationResult merged;
    int admitted = 0;
    int inFlight = 0;
    int completedBatches = 0;
    int itemsProcessed = 0;
    int errorCount = 0;
    int recovered = 0;
    bool aborted = false;
    bool memoryPressure = false;
    ReportError abortError;

    QElapsedTimer progressTimer;
    if (totalBatches > 0) {
        transition(op, Stage::ProcessingData);
        publishProgress(op, 0, totalBatches, 0,
                        QString("Processing %1 members in %2 batches").arg(members.size()).arg(totalBatches));
        progressTimer.start();
    }

    while (true) {
        // Under memory pressure only one batch is admitted at a time
        const int admitLimit = memoryPressure ? 1 : config.maxConcurrentBatches;
        while (!aborted && inFlight < admitLimit && admitted < totalBatches) {
            if (op->isCancelled()) {
                break;
            }
            const QList<MemberInfo> batch = batches.at(admitted);
            const int batchNumber = ++admitted;
            ++inFlight;
            m_workers.start([this, op, queue, batch, batchNumber]() {
                queue->push(processBatch(op, batch, batchNumber));
            });
        }

        if (inFlight == 0) {
            break;
        }

        BatchOutcome outcome = queue->take();
        --inFlight;

        if (op->isCancelled() || aborted) {
            LOG_DEBUG(QString("Report %1: discarding result of batch %2").arg(op->id).arg(outcome.batchNumber));
            continue;
        }

        ++completedBatches;
        itemsProcessed += outcome.memberCount;

        if (outcome.success) {
            merged.merge(outcome.classification);
        } else {
            ++errorCount;
            QJsonObject context;
            context["batchNumber"] = outcome.batchNumber;
            context["totalBatches"] = totalBatches;
            context["memberCount"] = outcome.memberCount;

            const bool withinBudget = config.enableErrorRecovery && errorCount <= config.maxErrors;
            ReportError batchError = makeError("BATCH_FAILED", outcome.errorMessage, Stage::ProcessingData,
                                               withinBudget, context, outcome.attempts - 1);
            {
                QMutexLocker locker(&op->mutex);
                op->batchErrors.append(batchError);
            }

            if (withinBudget) {
                ++recovered;
                LOG_WARNING(QString("Report %1: batch %2 failed after %3 attempts, continuing (%4/%5 errors)")
                           .arg(op->id).arg(outcome.batchNumber).arg(outcome.attempts)
                           .arg(errorCount).arg(config.maxErrors));
            } else {
                aborted = true;
                abortError = batchError;
                if (config.enableErrorRecovery) {
                    abortError.code = QStringLiteral("ERROR_BUDGET_EXCEEDED");
                    abortError.message = QString("%1 batches failed, budget is %2: %3")
                        .arg(errorCount).arg(config.maxErrors).arg(outcome.errorMessage);
                }
                LOG_ERROR(QString("Report %1: aborting after batch %2 failed: %3")
                         .arg(op->id).arg(outcome.batchNumber).arg(abortError.message));
                continue;
            }
        }

        {
            QMutexLocker locker(&op->mutex);
            op->statistics = statisticsFor(merged, members.size());
            op->statistics.batchesProcessed = completedBatches;
            op->statistics.errorsRecovered = recovered;
        }

        if (config.enablePartialResults && completedBatches % config.partialEveryBatches == 0) {
            transition(op, Stage::GeneratingPartial);

            QJsonObject partial;
            partial["operationId"] = op->id;
            partial["batchNumber"] = completedBatches;
            partial["totalBatches"] = totalBatches;
            partial["itemsProcessed"] = itemsProcessed;
            partial["isFinal"] = false;
            partial["preview"] = merged.toJson(config.previewActive, config.previewOthers);
            partial["statistics"] = statisticsFor(merged, members.size()).toJson();
            partial["timestamp"] = QDateTime::currentMSecsSinceEpoch();

            const QString id = op->id;
            post([this, id, partial]() { emit partialResult(id, partial); });
            transition(op, Stage::ProcessingData);
        }

        if (config.progressIntervalMs <= 0 || progressTimer.elapsed() >= config.progressIntervalMs) {
            publishProgress(op, completedBatches, totalBatches, itemsProcessed,
                            QString("Batch %1/%2 done (%3 members)")
                                .arg(outcome.batchNumber).arg(totalBatches).arg(outcome.memberCount));
            progressTimer.restart();
        }

        const qint64 thresholdBytes = static_cast<qint64>(config.memoryThresholdMB) * 1024 * 1024;
        qint64 currentBytes = sampleMemory();
        if (currentBytes > thresholdBytes) {
            LOG_WARNING(QString("Report %1: memory at %2 MB exceeds %3 MB, running cleanup")
                       .arg(op->id).arg(currentBytes / (1024 * 1024)).arg(config.memoryThresholdMB));
            const QString id = op->id;
            post([this, id, currentBytes, thresholdBytes]() { emit memoryWarning(id, currentBytes, thresholdBytes); });

            cleanupStaleOperations();
            currentBytes = sampleMemory();
        }
        memoryPressure = currentBytes > static_cast<qint64>(config.maxMemoryMB) * 1024 * 1024;
    }

    ReportStatistics statistics = statisticsFor(merged, members.size());
    statistics.batchesProcessed = completedBatches;
    statistics.errorsRecovered = recovered;
    statistics.processingTimeMs = runTimer.elapsed();
    {
        QMutexLocker locker(&m_mutex);
        statistics.memoryPeakBytes = m_peakBytes;
    }

    const QString id = op->id;

    if (op->isCancelled()) {
        transition(op, Stage::Cancelled);
        const QJsonObject partial = buildPayload(op, merged, statistics, false);
        {
            QMutexLocker locker(&op->mutex);
            op->statistics = statistics;
            op->result = partial;
        }
        LOG_INFO(QString("Report %1 cancelled after %2 of %3 batches").arg(id).arg(completedBatches).arg(totalBatches));
        post([this, id, partial]() { emit cancelled(id, partial); });
        return;
    }

    if (aborted) {
        transition(op, Stage::Error);
        const QJsonObject partial = buildPayload(op, merged, statistics, false);
        {
            QMutexLocker locker(&op->mutex);
            op->statistics = statistics;
            op->error = abortError;
            op->result = partial;
        }
        const QJsonObject errorJson = abortError.toJson();
        post([this, id, errorJson, partial]() { emit failed(id, errorJson, partial); });
        return;
    }

    transition(op, Stage::Finalizing);
    publishProgress(op, totalBatches, totalBatches, itemsProcessed, QStringLiteral("Building final report"));

    const QJsonObject result = buildPayload(op, merged, statistics, true);
    transition(op, Stage::Completed);
    {
        QMutexLocker locker(&op->mutex);
        op->statistics = statistics;
        op->result = result;
    }
    publishProgress(op, totalBatches, totalBatches, itemsProcessed, QStringLiteral("Report completed"));

    LOG_INFO(QString("Report %1 completed in %2 ms").arg(id).arg(statistics.processingTimeMs));
    LOG_DATA(Logger::Debug, statistics.toJson().toVariantMap());

    post([this, op, id, result]() {
        storeReport(op, result);
        emit completed(id, result);
    });
}

ReportEngine::BatchOutcome ReportEngine::processBatch(const std::shared_ptr<Operation>& op,
                                                      const QList<MemberInfo>& members, int batchNumber)
{
    BatchOutcome outcome;
    outcome.batchNumber = batchNumber;
    outcome.memberCount = members.size();

    QElapsedTimer timer;
    timer.start();

    QStringList userIds;
    userIds.reserve(members.size());
    for (const MemberInfo& member : members) {
        userIds.append(member.userId);
    }

    const ReportConfig& config = op->config;
    const ReportRequest& request = op->request;

    for (int attempt = 0; attempt <= config.maxRetries; ++attempt) {
        outcome.attempts = attempt + 1;

        QHash<QString, qint64> totals;
        bool ok = false;
        try {
            ok = m_source->batchActivity(userIds, request.guildId, request.startMs, request.endMs, totals);
            if (!ok) {
                outcome.errorMessage = QStringLiteral("activity totals could not be read");
            }
        } catch (const std::exception& ex) {
            outcome.errorMessage = QString::fromUtf8(ex.what());
        }

        if (ok) {
            QList<MemberActivity> activities;
            activities.reserve(members.size());
            for (const MemberInfo& member : members) {
                MemberActivity activity;
                activity.userId = member.userId;
                activity.displayName = member.displayName;
                activity.roles = member.roles;
                activity.totalTimeMs = totals.value(member.userId, 0);
                activities.append(activity);
            }
            outcome.classification = m_classifier->classify(activities, op->minHours);
            outcome.success = true;
            break;
        }

        LOG_WARNING(QString("Report %1: batch %2 attempt %3/%4 failed: %5")
                   .arg(op->id).arg(batchNumber).arg(attempt + 1).arg(config.maxRetries + 1)
                   .arg(outcome.errorMessage));

        if (attempt < config.maxRetries) {
            const qint64 delayMs = static_cast<qint64>(config.retryBaseDelayMs) << attempt;
            if (!sleepUnlessCancelled(op, delayMs)) {
                outcome.cancelled = true;
                break;
            }
        }
    }

    outcome.elapsedMs = timer.elapsed();
    return outcome;
}

bool ReportEngine::sleepUnlessCancelled(const std::shared_ptr<Operation>& op, qint64 delayMs) const
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < delayMs) {
        if (op->isCancelled()) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(50, delayMs - timer.elapsed() + 1)));
    }
    return !op->isCancelled();
}

QJsonObject ReportEngine::buildPayload(const std::shared_ptr<Operation>& op, const ClassificationResult& classification,
                                       const ReportStatistics& statistics, bool success) const
{
    QJsonObject payload;
    payload["operationId"] = op->id;
    payload["guildId"] = op->request.guildId;
    payload["filter"] = op->request.filter;
    payload["startTime"] = op->request.startMs;
    payload["endTime"] = op->request.endMs;
    payload["minHours"] = op->minHours;
    payload["generatedAt"] = QDateTime::currentMSecsSinceEpoch();
    payload["success"] = success;
    payload["fromCache"] = false;
    payload["classification"] = classification.toJson();
    payload["statistics"] = statistics.toJson();

    QJsonArray errors;
    {
        QMutexLocker locker(&op->mutex);
        for (const ReportError& error : op->batchErrors) {
            errors.append(error.toJson());
        }
    }
    payload["errors"] = errors;
    return payload;
}

std::optional<QJsonObject> ReportEngine::lookupCachedReport(const QString& cacheKey)
{
    if (m_cache) {
        const std::optional<QByteArray> raw = m_cache->get(cacheKey);
        if (raw) {
            const QJsonDocument doc = QJsonDocument::fromJson(*raw);
            if (doc.isObject()) {
                return doc.object();
            }
            LOG_WARNING(QString("Malformed cached report under %1, discarding").arg(cacheKey));
            m_cache->remove(cacheKey);
        }
    }

    if (!m_reportCache || !m_reportCache->isInitialized()) {
        return std::nullopt;
    }

    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    const QSharedPointer<ReportCacheModel> stored = m_reportCache->getValid(cacheKey, nowMs);
    if (!stored) {
        return std::nullopt;
    }

    if (m_cache) {
        const int remainingSeconds = static_cast<int>(qMax<qint64>(1, (stored->expiresAtMs() - nowMs) / 1000));
        m_cache->set(cacheKey, QJsonDocument(stored->payload()).toJson(QJsonDocument::Compact), remainingSeconds);
    }
    return stored->payload();
}

void ReportEngine::storeReport(const std::shared_ptr<Operation>& op, const QJsonObject& result)
{
    if (!op->config.useCache) {
        return;
    }

    const QString key = op->request.cacheKey();
    const int ttlSeconds = op->config.reportCacheTtlHours * 60 * 60;

    if (m_cache) {
        m_cache->set(key, QJsonDocument(result).toJson(QJsonDocument::Compact), ttlSeconds);
    }

    if (m_reportCache && m_reportCache->isInitialized()) {
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        ReportCacheModel entry;
        entry.setCacheKey(key);
        entry.setGuildId(op->request.guildId);
        entry.setPayload(result);
        entry.setGeneratedAtMs(nowMs);
        entry.setExpiresAtMs(nowMs + static_cast<qint64>(ttlSeconds) * 1000);
        entry.setUserCount(result.value("statistics").toObject().value("totalMembers").toInt());
        entry.setGenerationTimeMs(result.value("statistics").toObject().value("processingTimeMs").toVariant().toLongLong());
        if (!m_reportCache->save(&entry)) {
            LOG_WARNING(QString("Report %1 could not be persisted under %2: %3")
                       .arg(op->id, key, m_reportCache->lastError()));
        }
    }
}

std::optional<QJsonObject> ReportEngine::operationStatus(const QString& operationId) const
{
    const std::shared_ptr<Operation> op = findOperation(operationId);
    if (!op) {
        return std::nullopt;
    }

    QMutexLocker locker(&op->mutex);
    QJsonObject status;
    status["operationId"] = op->id;
    status["request"] = op->request.toJson();
    status["stage"] = stageName(op->stage);
    status["startedAt"] = op->startedAtMs;
    status["finishedAt"] = op->finishedAtMs > 0 ? QJsonValue(op->finishedAtMs) : QJsonValue(QJsonValue::Null);
    status["fromCache"] = op->fromCache;
    status["cancelRequested"] = op->isCancelled();
    status["progress"] = op->lastProgress;
    status["statistics"] = op->statistics.toJson();

    QJsonArray errors;
    for (const ReportError& error : op->batchErrors) {
        errors.append(error.toJson());
    }
    status["errors"] = errors;
    if (op->error) {
        status["error"] = op->error->toJson();
    }
    if (isTerminal(op->stage)) {
        status["result"] = op->result;
    }
    return status;
}

int ReportEngine::activeOperations() const
{
    QMutexLocker locker(&m_mutex);
    int running = 0;
    for (const auto& op : m_operations) {
        QMutexLocker opLocker(&op->mutex);
        if (!isTerminal(op->stage)) {
            ++running;
        }
    }
    return running;
}

qint64 ReportEngine::sampleMemory()
{
    const qint64 bytes = m_memorySampler ? m_memorySampler() : 0;
    QMutexLocker locker(&m_mutex);
    m_currentBytes = bytes;
    m_peakBytes = qMax(m_peakBytes, bytes);
    return bytes;
}

QJsonObject ReportEngine::memoryStats() const
{
    QMutexLocker locker(&m_mutex);
    QJsonObject json;
    json["currentBytes"] = m_currentBytes;
    json["peakBytes"] = m_peakBytes;
    json["cleanupCount"] = m_cleanupCount;
    json["cachedContexts"] = m_operations.size();
    json["thresholdBytes"] = static_cast<qint64>(m_defaults.memoryThresholdMB) * 1024 * 1024;
    return json;
}

int ReportEngine::cleanupStaleOperations(qint64 nowMs)
{
    const qint64 current = nowMs >= 0 ? nowMs : QDateTime::currentMSecsSinceEpoch();

    int removed = 0;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_operations.begin(); it != m_operations.end();) {
            bool stale = false;
            {
                QMutexLocker opLocker(&it.value()->mutex);
                stale = isTerminal(it.value()->stage) && it.value()->finishedAtMs > 0
                        && current - it.value()->finishedAtMs > StaleContextAgeMs;
            }
            if (stale) {
                it = m_operations.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        ++m_cleanupCount;
    }

    const int purged = m_cache ? m_cache->local().purgeExpired() : 0;
    LOG_INFO(QString("Cleanup dropped %1 operation contexts and %2 expired local cache entries").arg(removed).arg(purged));
    return removed;
}

bool ReportEngine::waitForIdle(int timeoutMs)
{
    if (!m_coordinators.waitForDone(timeoutMs)) {
        return false;
    }
    return m_workers.waitForDone(timeoutMs);
}

qint64 ReportEngine::processResidentBytes()
{
#ifdef Q_OS_UNIX
    QFile statm(QStringLiteral("/proc/self/statm"));
    if (!statm.open(QIODevice::ReadOnly)) {
        return 0;
    }
    const QList<QByteArray> fields = statm.readAll().simplified().split(' ');
    if (fields.size() < 2) {
        return 0;
    }
    bool ok = false;
    const qint64 residentPages = fields.at(1).toLongLong(&ok);
    return ok ? residentPages * static_cast<qint64>(sysconf(_SC_PAGESIZE)) : 0;
#else
    return 0;
#endif
}
