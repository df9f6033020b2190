#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>
#include <QMutex>

class QFile;

/**
 * Unified logging system for SubMux
 *
 * Every module logs through this class so that a run leaves one consistent trail:
 * - Outputs to console (qDebug)
 * - Appends to an optional log file (configured from Settings::LoggingSettings)
 * - Emits a signal so observers (tests, report collectors) can follow the run
 *
 * Usage:
 *   LOG("Your message here");
 *   LOG(QString("Matched %1 pairs").arg(count));
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    /**
     * Main unified logging function
     *
     * @param msg The message to log
     * @param file Source file name - prefer using the LOG macro over __FILE__
     * @param line Source line number - prefer using the LOG macro over __LINE__
     *
     * When file is empty or line is not positive the message is logged without
     * the [file:line] prefix.
     */
    static void log(const QString &msg, const QString &file, int line);

    /**
     * Get the singleton instance of the Logger
     */
    static Logger* instance();

    /**
     * @brief Mirror all subsequent messages into a log file
     * @param path File to append to; an empty path disables the file sink
     * @return false if the file could not be opened (console logging continues)
     */
    bool setLogFile(const QString &path);

    /**
     * @brief Path of the active log file, empty when the file sink is disabled
     */
    QString logFile() const;

signals:
    /**
     * Emitted once per logged message, with the [file:line] prefix applied
     */
    void logMessage(QString message);

private:
    Logger();
    ~Logger() override;

    void writeToFile(const QString &message);

    mutable QMutex m_fileMutex;
    QFile *m_file;
};

/**
 * Convenience macro for logging with file and line info
 * Usage: LOG("Your message")
 */
#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)

#endif // LOGGER_H
