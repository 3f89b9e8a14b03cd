#include "settings.h"
#include <QDir>

namespace FieldSync {

namespace {
const char *kDefaultEndpoint = "https://www.google.com/generate_204";
}

Settings& Settings::instance()
{
    static Settings instance;
    return instance;
}

Settings::Settings()
    : m_settings("QFieldSync", "QFieldSync")
{
}

// ========== Data ==========

QString Settings::dataDirectory() const
{
    return m_settings.value("data/directory", QDir::home().filePath("FieldSync")).toString();
}

void Settings::setDataDirectory(const QString &path)
{
    m_settings.setValue("data/directory", QDir::cleanPath(path));
}

bool Settings::useMockRemote() const
{
    return m_settings.value("data/useMockRemote", false).toBool();
}

void Settings::setUseMockRemote(bool enabled)
{
    m_settings.setValue("data/useMockRemote", enabled);
}

// ========== Connectivity ==========

QString Settings::reachabilityEndpoint() const
{
    return m_settings.value("connectivity/endpoint", QString(kDefaultEndpoint)).toString();
}

void Settings::setReachabilityEndpoint(const QString &url)
{
    m_settings.setValue("connectivity/endpoint", url);
}

int Settings::probeIntervalMs() const
{
    return m_settings.value("connectivity/intervalMs", DEFAULT_PROBE_INTERVAL_MS).toInt();
}

void Settings::setProbeIntervalMs(int intervalMs)
{
    m_settings.setValue("connectivity/intervalMs", intervalMs);
}

int Settings::probeTimeoutMs() const
{
    return m_settings.value("connectivity/timeoutMs", DEFAULT_PROBE_TIMEOUT_MS).toInt();
}

void Settings::setProbeTimeoutMs(int timeoutMs)
{
    m_settings.setValue("connectivity/timeoutMs", timeoutMs);
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings.value("advanced/debugLogging", false).toBool();
}

void Settings::setDebugLogging(bool enabled)
{
    m_settings.setValue("advanced/debugLogging", enabled);
}

void Settings::sync()
{
    m_settings.sync();
}

} // namespace FieldSync
