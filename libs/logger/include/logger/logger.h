#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QVariant>
#include <QThread>

#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define DECL_EXPORT __declspec(dllexport)
#  define DECL_IMPORT __declspec(dllimport)
#else
#  define DECL_EXPORT     __attribute__((visibility("default")))
#  define DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(LOGGER_LIBRARY)
#  define LOGGER_EXPORT DECL_EXPORT
#else
#  define LOGGER_EXPORT DECL_IMPORT
#endif

/**
 * @brief Process-wide thread-safe logger
 *
 * Writes formatted records to the console and to an append-mode log file.
 * The file is rotated once it grows past the configured size limit.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
     */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Degraded operation, the caller continues
        Error,    ///< A failed operation
        Fatal     ///< Startup or invariant failure
    };
    Q_ENUM(LogLevel)

    /**
     * @brief Gets the singleton instance of the logger
     * @return Pointer to the Logger instance
     */
    static Logger* instance();

    /**
     * @brief Parses a level name (debug, info, warning, error, fatal)
     * @param name Case-insensitive level name
     * @param fallback Level returned for unknown names
     */
    static LogLevel levelFromString(const QString& name, LogLevel fallback = Info);

    /**
     * @brief Sets the output log file path and reopens the file
     * @param filePath The full path to the log file
     */
    void setLogFile(const QString& filePath);

    /**
     * @brief Sets the rotation policy for the log file
     * @param maxBytes Size after which the file is rotated, 0 disables rotation
     * @param backupCount Number of rotated files kept as file.1 ... file.N
     */
    void setRotation(qint64 maxBytes, int backupCount);

    /**
     * @brief Sets the minimum log level for message filtering
     * @param level The minimum LogLevel to output
     */
    void setLogLevel(LogLevel level);

    /**
     * @brief Enables or disables console output
     * @param enable True to enable console output, false to disable
     * @return The new console output state
     */
    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line Source line, negative when unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs key-value pairs as a single record
     * @param level The log level
     * @param data The key-value pairs to log
     * @param source The source function or class name
     * @param line Source line, negative when unknown
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    QMutex m_mutex;
    QString m_logFilePath;
    qint64 m_maxFileBytes;
    int m_backupCount;

    QString logLevelToString(LogLevel level) const;
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const;

    // Callers hold m_mutex
    void writeToLog(const QString& message);
    void rotateIfNeeded();
    bool openLogFile();
};

#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
