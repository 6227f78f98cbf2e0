#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>

namespace notch {

/// Runtime configuration shared by notch-display, notch-mcp and notchctl.
/// Built-in defaults are deep-merged with the YAML file on load, so a file
/// only needs the keys it overrides. Paths default to the user's home
/// directory so both processes agree without any configuration.
class YamlConfig {
public:
    YamlConfig();

    /// Returns false (and keeps defaults) if the file is missing or invalid.
    bool load(const QString& filePath);

    static QString defaultConfigPath();

    // Socket
    QString socketPath() const;
    int socketBacklog() const;
    int socketBufferBytes() const;
    int socketReceiveTimeoutMs() const;
    int socketSendTimeoutMs() const;

    // Store
    QString storePath() const;
    QString storeLockPath() const;
    int staleAfterSec() const;          // 0 = never sweep

    // MCP
    int pollIntervalMs() const;
    int maxPolls() const;
    bool watchStore() const;

    // Logging
    QString logLevel() const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace notch
