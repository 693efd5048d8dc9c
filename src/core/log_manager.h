#pragma once
#include <QObject>
#include <QFile>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    void initialize(const QString& logDir);

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

    // stdout carries protocol traffic, so the console sink is stderr.
    void setStderrEnabled(bool enabled) { m_stderrEnabled = enabled; }
    void setMinimumLevel(Level level) { m_minimumLevel = level; }
    Level minimumLevel() const { return m_minimumLevel; }

    static QString formatMessage(Level level, const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    bool m_stderrEnabled = false;
    Level m_minimumLevel = Debug;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

#define LOG_CAT_DEBUG(cat, msg) LogManager::instance().log(LogManager::Debug, QStringLiteral(cat), msg)
#define LOG_CAT_INFO(cat, msg) LogManager::instance().log(LogManager::Info, QStringLiteral(cat), msg)
#define LOG_CAT_WARNING(cat, msg) LogManager::instance().log(LogManager::Warning, QStringLiteral(cat), msg)
#define LOG_CAT_ERROR(cat, msg) LogManager::instance().log(LogManager::Error, QStringLiteral(cat), msg)
