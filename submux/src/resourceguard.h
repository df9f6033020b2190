#ifndef RESOURCEGUARD_H
#define RESOURCEGUARD_H

#include <QString>

/**
 * @brief Result of locating and probing the merge tool
 */
struct MergeToolInfo {
    QString path;                 // Resolved executable, empty if not found
    QString version;              // e.g. "81.0", empty if the probe failed
    bool isAvailable = false;     // Found and answered --version with exit code 0
    QString unavailableReason;
};

/**
 * @brief Preflight checks for the embed workflow
 *
 * Locates mkvmerge (configured path, then bin/ beside the application, then
 * PATH), probes it once with --version and keeps the answer for the rest of
 * the run, and reports free space on the volume that hosts a path.
 *
 * None of the queries touch media files. availableBytes() and runProbe() are
 * virtual so tests can simulate a full disk or a missing tool.
 */
class ResourceGuard
{
public:
    static constexpr int PROBE_TIMEOUT_MS = 5000;
    static constexpr int SPACE_FACTOR_PERCENT = 110;   // Required space = pair size x 1.1

    explicit ResourceGuard(const QString& configuredToolPath = QString());
    virtual ~ResourceGuard() = default;

    QString configuredToolPath() const { return m_configuredToolPath; }

    /**
     * @brief Find the merge tool executable
     * @return Absolute path, or an empty string if no candidate exists
     */
    QString locateMergeTool() const;

    /**
     * @brief Locate and probe the merge tool
     *
     * The first call runs "<tool> --version"; later calls return the cached
     * result until resetProbe() is called.
     */
    const MergeToolInfo& probeMergeTool();
    bool isProbed() const { return m_probed; }
    void resetProbe();

    /**
     * @brief Free bytes on the volume hosting path
     * @return Byte count, -1 if the volume cannot be queried
     */
    virtual qint64 availableBytes(const QString& path) const;

    /// Space a merge needs: (video + subtitle) x 1.1, rounded up
    static qint64 requiredBytes(qint64 videoBytes, qint64 subtitleBytes);

    /**
     * @brief Check that a merge of the given sizes fits beside path
     * @param available Receives the free byte count when not null
     */
    bool hasSpaceFor(const QString& path, qint64 videoBytes, qint64 subtitleBytes,
                     qint64 *available = nullptr) const;

    /// Executable name for the current platform ("mkvmerge" or "mkvmerge.exe")
    static QString mergeToolExecutableName();

protected:
    virtual MergeToolInfo runProbe(const QString& toolPath) const;

private:
    static QString extractVersion(const QString& output);

    QString m_configuredToolPath;
    MergeToolInfo m_info;
    bool m_probed;
};

#endif // RESOURCEGUARD_H
