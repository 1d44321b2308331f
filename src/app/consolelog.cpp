#include "consolelog.h"

#include <QDateTime>
#include <cstdio>

namespace FieldSync {

ConsoleLog::ConsoleLog(QIODevice *device, QObject *parent)
    : QObject(parent)
    , m_device(device)
{
    if (!m_device) {
        if (m_stderr.open(stderr, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
            m_device = &m_stderr;
        }
    }
}

void ConsoleLog::logInfo(const QString &message)
{
    write("INFO", message);
}

void ConsoleLog::logWarning(const QString &message)
{
    m_warnings++;
    write("WARNING", message);
}

void ConsoleLog::logError(const QString &message)
{
    m_errors++;
    write("ERROR", message);
}

void ConsoleLog::write(const char *level, const QString &message)
{
    if (!m_device) {
        return;
    }

    QString line = QString("[%1] %2\n").arg(QLatin1String(level), message);
    if (m_timestamps) {
        line.prepend(QDateTime::currentDateTime().toString("hh:mm:ss.zzz") + ' ');
    }
    m_device->write(line.toUtf8());
}

} // namespace FieldSync
