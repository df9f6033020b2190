#include "logger.h"
#include <QDebug>
#include <QDateTime>
#include <QFile>
#include <QMutexLocker>
#include <QTextStream>

// The instance lives for the whole process, like the QCoreApplication it logs for.
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;

Logger::Logger()
    : QObject(nullptr)
    , m_file(nullptr)
{
}

Logger::~Logger()
{
    if (m_file) {
        m_file->close();
        delete m_file;
    }
}

Logger* Logger::instance()
{
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

void Logger::log(const QString &msg, const QString &file, int line)
{
    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        // Extract just the filename from the full path
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }

        fullMessage = QString("[%1:%2] %3").arg(filename).arg(line).arg(msg);
    }
    else
    {
        fullMessage = msg;
    }

    qDebug().noquote() << fullMessage;

    Logger *logger = instance();
    logger->writeToFile(fullMessage);
    emit logger->logMessage(fullMessage);
}

bool Logger::setLogFile(const QString &path)
{
    QMutexLocker locker(&m_fileMutex);

    if (m_file) {
        m_file->close();
        delete m_file;
        m_file = nullptr;
    }

    if (path.isEmpty()) {
        return true;
    }

    QFile *file = new QFile(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning().noquote() << QString("Logger: cannot open log file %1: %2").arg(path, file->errorString());
        delete file;
        return false;
    }

    m_file = file;
    return true;
}

QString Logger::logFile() const
{
    QMutexLocker locker(&m_fileMutex);
    return m_file ? m_file->fileName() : QString();
}

void Logger::writeToFile(const QString &message)
{
    QMutexLocker locker(&m_fileMutex);
    if (!m_file) {
        return;
    }

    QTextStream out(m_file);
    out << "[" << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss") << "] " << message << "\n";
    out.flush();
}
