#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStandardPaths>

namespace {

// Q_FUNC_INFO on gcc/clang reads "ret Class::method(args) [with T = X]"; keep Class::method
QString shortSource(const QString& source)
{
    QString trimmed = source.left(source.indexOf('(') > 0 ? source.indexOf('(') : source.size());
    trimmed = trimmed.mid(trimmed.lastIndexOf(' ') + 1);

    static const QRegularExpression templated("([A-Za-z0-9_]+)<(?:class\\s+)?([A-Za-z0-9_:]+)>::([A-Za-z0-9_~]+)$");
    const QRegularExpressionMatch match = templated.match(trimmed);
    if (match.hasMatch()) {
        trimmed = QString("%1<%2>::%3").arg(match.captured(1), match.captured(2), match.captured(3));
    }
    return trimmed;
}

QString backupName(const QString& path, int index)
{
    return QString("%1.%2").arg(path).arg(index);
}

}

Logger* Logger::instance() {
    static Logger* logger = new Logger();
    return logger;
}

Logger::LogLevel Logger::levelFromString(const QString& name, LogLevel fallback) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == "debug") return Debug;
    if (lowered == "info") return Info;
    if (lowered == "warning" || lowered == "warn") return Warning;
    if (lowered == "error") return Error;
    if (lowered == "fatal") return Fatal;
    return fallback;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
    , m_maxFileBytes(0)
    , m_backupCount(0)
{
    QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (logDir.isEmpty()) {
        logDir = QDir::tempPath();
    }
    QDir().mkpath(logDir);

    // setLogFile() logs through the lock, so open directly here
    m_logFilePath = logDir + "/presence_tracker.log";
    if (!openLogFile()) {
        qWarning() << "Failed to open log file:" << m_logFilePath;
    }
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::openLogFile() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    QFileInfo info(m_logFilePath);
    if (!info.dir().exists()) {
        QDir().mkpath(info.absolutePath());
    }

    m_logFile.setFileName(m_logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    m_logStream.setDevice(&m_logFile);
    return true;
}

void Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    m_logFilePath = filePath;
    if (openLogFile()) {
        writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    } else {
        qWarning() << "Failed to open log file:" << filePath;
    }
}

void Logger::setRotation(qint64 maxBytes, int backupCount) {
    QMutexLocker locker(&m_mutex);
    m_maxFileBytes = qMax<qint64>(0, maxBytes);
    m_backupCount = qMax(0, backupCount);
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), QString(), -1));
}

bool Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
    return m_consoleOutput;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < m_logLevel) {
        return;
    }

    const QString record = formatLogMessage(level, message, source, line);

    QMutexLocker locker(&m_mutex);
    writeToLog(record);
    if (!m_consoleOutput) {
        return;
    }

    if (level >= Error) {
        qCritical().noquote() << record;
    } else if (level == Warning) {
        qWarning().noquote() << record;
    } else if (level == Info) {
        qInfo().noquote() << record;
    } else {
        qDebug().noquote() << record;
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < m_logLevel) {
        return;
    }

    QStringList pairs;
    pairs.reserve(data.size());
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        pairs.append(it.key() + "=" + it.value().toString());
    }
    log(level, pairs.join(' '), source, line);
}

QString Logger::logLevelToString(LogLevel level) const {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const {
    QString header = QString("[%1] [%2] [PID:%3] [TID:%4]")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"),
             logLevelToString(level),
             QString::number(QCoreApplication::applicationPid()),
             QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId())));

    if (!source.isEmpty()) {
        header += QString(" [%1]").arg(line >= 0 ? QString("%1:%2").arg(shortSource(source)).arg(line)
                                                 : shortSource(source));
    }
    return header + " " + message;
}

void Logger::rotateIfNeeded() {
    if (m_maxFileBytes <= 0 || !m_logFile.isOpen() || m_logFile.size() < m_maxFileBytes) {
        return;
    }

    m_logStream.flush();
    m_logFile.close();

    // file -> file.1 -> ... -> file.N, the oldest backup falls off
    QFile::remove(m_backupCount > 0 ? backupName(m_logFilePath, m_backupCount) : m_logFilePath);
    for (int i = m_backupCount - 1; i >= 1; --i) {
        QFile::rename(backupName(m_logFilePath, i), backupName(m_logFilePath, i + 1));
    }
    if (m_backupCount > 0) {
        QFile::rename(m_logFilePath, backupName(m_logFilePath, 1));
    }

    if (!openLogFile()) {
        qWarning() << "Log file could not be reopened after rotation:" << m_logFilePath;
    }
}

void Logger::writeToLog(const QString& message) {
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
        rotateIfNeeded();
    }
}
