#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <cstdint>

namespace ngd {

/// Ready-to-send Notify() call, in the argument order of
/// org.freedesktop.Notifications.Notify (susssasa{sv}i).
///
/// Only RequestBuilder fills one in; a default-constructed request is an
/// empty notification with the server-default timeout.
class NotificationRequest {
public:
    NotificationRequest() = default;

    const QString& applicationName() const { return applicationName_; }
    uint32_t replacesId() const { return replacesId_; }
    const QString& icon() const { return icon_; }
    const QString& summary() const { return summary_; }
    const QString& body() const { return body_; }
    const QStringList& actions() const { return actions_; }
    const QVariantMap& hints() const { return hints_; }
    int32_t expireTimeoutMillis() const { return expireTimeoutMillis_; }

    bool operator==(const NotificationRequest& other) const;

private:
    friend class RequestBuilder;

    QString applicationName_;
    uint32_t replacesId_ = 0;
    QString icon_;
    QString summary_;
    QString body_;
    QStringList actions_;
    QVariantMap hints_;
    int32_t expireTimeoutMillis_ = -1;
};

} // namespace ngd
