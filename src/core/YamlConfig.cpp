#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <vector>

namespace ngp {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["transport"]["bus"] = "session";
    root_["transport"]["service"] = "org.freedesktop.Notifications";
    root_["transport"]["path"] = "/org/freedesktop/Notifications";
    root_["transport"]["interface"] = "org.freedesktop.Notifications";
    root_["transport"]["call_timeout_ms"] = 25000;

    root_["proxy"]["socket_path"] = "/run/notify-guard/proxy.sock";
    root_["proxy"]["max_request_bytes"] = 4194304;
    root_["proxy"]["forward_events"] = true;
    root_["proxy"]["reject_control_characters"] = false;

    root_["logging"]["level"] = "info";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        std::vector<std::string> ignored;
        root_ = mergeYaml(defaults, loaded, &ignored);
        for (const auto& key : ignored)
            BOOST_LOG_TRIVIAL(warning) << "Config " << filePath.toStdString()
                                       << ": ignoring unknown or mistyped key '" << key << "'";
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Failed to load config " << filePath.toStdString()
                                 << ": " << e.what();
        root_ = defaults;
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "Cannot write config " << filePath.toStdString();
        return false;
    }
    fout << root_;
    return fout.good();
}

// --- Transport ---

QString YamlConfig::busType() const
{
    return QString::fromStdString(root_["transport"]["bus"].as<std::string>("session"));
}

void YamlConfig::setBusType(const QString& v)
{
    root_["transport"]["bus"] = v.toStdString();
}

QString YamlConfig::service() const
{
    return QString::fromStdString(
        root_["transport"]["service"].as<std::string>("org.freedesktop.Notifications"));
}

void YamlConfig::setService(const QString& v)
{
    root_["transport"]["service"] = v.toStdString();
}

QString YamlConfig::objectPath() const
{
    return QString::fromStdString(
        root_["transport"]["path"].as<std::string>("/org/freedesktop/Notifications"));
}

void YamlConfig::setObjectPath(const QString& v)
{
    root_["transport"]["path"] = v.toStdString();
}

QString YamlConfig::interfaceName() const
{
    return QString::fromStdString(
        root_["transport"]["interface"].as<std::string>("org.freedesktop.Notifications"));
}

void YamlConfig::setInterfaceName(const QString& v)
{
    root_["transport"]["interface"] = v.toStdString();
}

int YamlConfig::callTimeoutMs() const
{
    return root_["transport"]["call_timeout_ms"].as<int>(25000);
}

void YamlConfig::setCallTimeoutMs(int v)
{
    root_["transport"]["call_timeout_ms"] = v;
}

// --- Proxy ---

QString YamlConfig::socketPath() const
{
    return QString::fromStdString(
        root_["proxy"]["socket_path"].as<std::string>("/run/notify-guard/proxy.sock"));
}

void YamlConfig::setSocketPath(const QString& v)
{
    root_["proxy"]["socket_path"] = v.toStdString();
}

int YamlConfig::maxRequestBytes() const
{
    return root_["proxy"]["max_request_bytes"].as<int>(4194304);
}

void YamlConfig::setMaxRequestBytes(int v)
{
    root_["proxy"]["max_request_bytes"] = v;
}

bool YamlConfig::forwardEvents() const
{
    return root_["proxy"]["forward_events"].as<bool>(true);
}

void YamlConfig::setForwardEvents(bool v)
{
    root_["proxy"]["forward_events"] = v;
}

bool YamlConfig::rejectControlCharacters() const
{
    return root_["proxy"]["reject_control_characters"].as<bool>(false);
}

void YamlConfig::setRejectControlCharacters(bool v)
{
    root_["proxy"]["reject_control_characters"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    const QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only keys present in the defaults, and only leaves, may be written.
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace ngp
