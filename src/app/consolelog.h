#ifndef CONSOLELOG_H
#define CONSOLELOG_H

#include <QObject>
#include <QFile>

class QIODevice;

namespace FieldSync {

/**
 * @brief Log sink for the command line tool
 *
 * Formats INFO, WARNING and ERROR lines and writes them to stderr, or to
 * the device given at construction. Counts warnings and errors so the
 * caller can pick an exit code.
 */
class ConsoleLog : public QObject
{
    Q_OBJECT

public:
    explicit ConsoleLog(QIODevice *device = nullptr, QObject *parent = nullptr);

    void setTimestamps(bool enabled) { m_timestamps = enabled; }

    int warningCount() const { return m_warnings; }
    int errorCount() const { return m_errors; }

public slots:
    void logInfo(const QString &message);
    void logWarning(const QString &message);
    void logError(const QString &message);

private:
    void write(const char *level, const QString &message);

    QFile m_stderr;
    QIODevice *m_device = nullptr;
    bool m_timestamps = false;
    int m_warnings = 0;
    int m_errors = 0;
};

} // namespace FieldSync

#endif // CONSOLELOG_H
