#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>
#include <cstdint>

namespace ngp {

/// Proxy configuration. Built-in defaults are deep-merged under whatever
/// the loaded file sets, so a partial file is always complete.
class YamlConfig {
public:
    YamlConfig();

    /// Returns false (and keeps the defaults) when the file cannot be parsed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Transport
    QString busType() const;            // "session" or "system"
    void setBusType(const QString& v);
    QString service() const;
    void setService(const QString& v);
    QString objectPath() const;
    void setObjectPath(const QString& v);
    QString interfaceName() const;
    void setInterfaceName(const QString& v);
    int callTimeoutMs() const;
    void setCallTimeoutMs(int v);

    // Proxy
    QString socketPath() const;
    void setSocketPath(const QString& v);
    int maxRequestBytes() const;
    void setMaxRequestBytes(int v);
    bool forwardEvents() const;
    void setForwardEvents(bool v);
    bool rejectControlCharacters() const;
    void setRejectControlCharacters(bool v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Generic dot-path access (e.g. "transport.service")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace ngp
