#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QSettings>

namespace FieldSync {

/**
 * @brief Global application settings manager using QSettings
 *
 * Persists preferences that are NOT agent-specific.
 * Agent-specific settings (identity, numbering, daily sync) are stored in
 * the AgentProfile within the data folder itself.
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/QFieldSync/QFieldSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 */
class Settings
{
public:
    static Settings& instance();

    // ========== Data ==========

    // Data folder holding the agent profile, queue and sync state
    QString dataDirectory() const;
    void setDataDirectory(const QString &path);

    // Use the built-in mock remote instead of a real transport
    bool useMockRemote() const;
    void setUseMockRemote(bool enabled);

    // ========== Connectivity ==========

    QString reachabilityEndpoint() const;
    void setReachabilityEndpoint(const QString &url);

    int probeIntervalMs() const;
    void setProbeIntervalMs(int intervalMs);

    int probeTimeoutMs() const;
    void setProbeTimeoutMs(int timeoutMs);

    static const int DEFAULT_PROBE_INTERVAL_MS = 30000;
    static const int DEFAULT_PROBE_TIMEOUT_MS = 3000;

    // ========== Advanced Settings ==========
    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    // Sync to disk
    void sync();

private:
    Settings();
    ~Settings() = default;
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    QSettings m_settings;
};

} // namespace FieldSync

#endif // SETTINGS_H
