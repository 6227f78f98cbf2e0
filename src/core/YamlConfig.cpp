#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>

namespace notch {

namespace {

// Deep merge: mappings recurse, sequences and scalars from the overlay win,
// keys missing from the overlay keep their default.
YAML::Node overlayOnto(const YAML::Node& defaults, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsDefined() || defaults.IsNull() || !defaults.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = merged[key] ? overlayOnto(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

QString homeFile(const char* name)
{
    return QDir::homePath() + '/' + QLatin1String(name);
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["socket"]["path"] = homeFile(".notch.sock").toStdString();
    root_["socket"]["backlog"] = 5;
    root_["socket"]["buffer_bytes"] = 65536;
    root_["socket"]["receive_timeout_ms"] = 2000;
    root_["socket"]["send_timeout_ms"] = 2000;

    root_["store"]["path"] = homeFile(".notch_pending_actions.json").toStdString();
    root_["store"]["lock_path"] = homeFile(".notch_pending_actions.lock").toStdString();
    root_["store"]["stale_after_sec"] = 0;

    root_["mcp"]["poll_interval_ms"] = 1000;
    root_["mcp"]["max_polls"] = 50;
    root_["mcp"]["watch_store"] = false;

    root_["logging"]["level"] = "info";
}

QString YamlConfig::defaultConfigPath()
{
    return QDir::homePath() + "/.notch/config.yaml";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFile::exists(filePath))
        return false;

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = overlayOnto(YAML::Clone(root_), loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Failed to parse " << filePath.toStdString()
                                 << ": " << e.what() << " (using defaults)";
        initDefaults();
        return false;
    }
    return true;
}

// --- Socket ---

QString YamlConfig::socketPath() const
{
    return QString::fromStdString(root_["socket"]["path"].as<std::string>(""));
}

int YamlConfig::socketBacklog() const
{
    return root_["socket"]["backlog"].as<int>(5);
}

int YamlConfig::socketBufferBytes() const
{
    return root_["socket"]["buffer_bytes"].as<int>(65536);
}

int YamlConfig::socketReceiveTimeoutMs() const
{
    return root_["socket"]["receive_timeout_ms"].as<int>(2000);
}

int YamlConfig::socketSendTimeoutMs() const
{
    return root_["socket"]["send_timeout_ms"].as<int>(2000);
}

// --- Store ---

QString YamlConfig::storePath() const
{
    return QString::fromStdString(root_["store"]["path"].as<std::string>(""));
}

QString YamlConfig::storeLockPath() const
{
    return QString::fromStdString(root_["store"]["lock_path"].as<std::string>(""));
}

int YamlConfig::staleAfterSec() const
{
    return root_["store"]["stale_after_sec"].as<int>(0);
}

// --- MCP ---

int YamlConfig::pollIntervalMs() const
{
    return root_["mcp"]["poll_interval_ms"].as<int>(1000);
}

int YamlConfig::maxPolls() const
{
    return root_["mcp"]["max_polls"].as<int>(50);
}

bool YamlConfig::watchStore() const
{
    return root_["mcp"]["watch_store"].as<bool>(false);
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

} // namespace notch
