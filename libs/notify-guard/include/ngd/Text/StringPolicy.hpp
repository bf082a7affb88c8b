#pragma once

#include <QList>
#include <QString>
#include <functional>

namespace ngd {

/// One code point a policy refused. position counts code points, not UTF-16 units.
struct StringViolation {
    int position = 0;
    char32_t codePoint = 0;

    bool operator==(const StringViolation& other) const
    {
        return position == other.position && codePoint == other.codePoint;
    }
};

/// Outcome of running raw text through an IStringPolicy: either Accepted(text)
/// or Rejected(text, violations). The caller decides whether a rejection
/// drops the request or continues with stripped().
class StringValidation {
public:
    static StringValidation accepted(QString text);
    static StringValidation rejected(QString text, QList<StringViolation> violations);

    bool isAccepted() const { return violations_.isEmpty(); }
    const QString& text() const { return text_; }
    const QList<StringViolation>& violations() const { return violations_; }

    /// The text with every offending code point removed.
    QString stripped() const;

private:
    StringValidation() = default;

    QString text_;
    QList<StringViolation> violations_;
};

/// Content rule applied to untrusted text before it is marked trusted.
class IStringPolicy {
public:
    virtual ~IStringPolicy() = default;
    virtual StringValidation check(const QString& raw) const = 0;
};

/// Forwards everything. The rule the display layer actually needs is not
/// defined yet, so this is the default.
class AcceptAllPolicy : public IStringPolicy {
public:
    StringValidation check(const QString& raw) const override;
};

/// Rejects every code point the predicate returns false for and reports each one.
class CodePointPolicy : public IStringPolicy {
public:
    using Predicate = std::function<bool(char32_t codePoint)>;

    explicit CodePointPolicy(Predicate allowed);

    StringValidation check(const QString& raw) const override;

private:
    Predicate allowed_;
};

/// Refuses C0 and C1 control characters (Unicode category Cc), DEL included.
/// Tab and line feed are allowed since servers render them in bodies.
class ControlCharacterPolicy : public CodePointPolicy {
public:
    ControlCharacterPolicy();
};

} // namespace ngd
