#pragma once

#include <QList>
#include <QString>

namespace ngd {

/// Text that may be forwarded verbatim to the notification server.
///
/// Constructed once at the boundary and never mutated. Everything downstream
/// of the boundary takes TrustedString, never QString.
class TrustedString {
public:
    /// Marks text as trusted. Accepts any input unchanged; run it through an
    /// IStringPolicy first when content rules apply.
    static TrustedString mark(QString raw);

    /// Read-only access for RequestBuilder.
    const QString& inner() const { return text_; }

    bool operator==(const TrustedString& other) const { return text_ == other.text_; }

private:
    explicit TrustedString(QString text);

    QString text_;
};

using TrustedStringList = QList<TrustedString>;

} // namespace ngd
