#include <ngd/Text/StringPolicy.hpp>
#include <boost/log/trivial.hpp>
#include <QChar>
#include <QSet>
#include <utility>

namespace ngd {

StringValidation StringValidation::accepted(QString text)
{
    StringValidation v;
    v.text_ = std::move(text);
    return v;
}

StringValidation StringValidation::rejected(QString text, QList<StringViolation> violations)
{
    StringValidation v;
    v.text_ = std::move(text);
    v.violations_ = std::move(violations);
    return v;
}

QString StringValidation::stripped() const
{
    if (violations_.isEmpty())
        return text_;

    QSet<int> offending;
    for (const auto& violation : violations_)
        offending.insert(violation.position);

    const QList<uint> codePoints = text_.toUcs4();
    QList<char32_t> kept;
    kept.reserve(codePoints.size());
    for (int i = 0; i < codePoints.size(); ++i) {
        if (!offending.contains(i))
            kept.append(static_cast<char32_t>(codePoints[i]));
    }
    return QString::fromUcs4(kept.constData(), kept.size());
}

StringValidation AcceptAllPolicy::check(const QString& raw) const
{
    return StringValidation::accepted(raw);
}

CodePointPolicy::CodePointPolicy(Predicate allowed)
    : allowed_(std::move(allowed))
{
}

StringValidation CodePointPolicy::check(const QString& raw) const
{
    QList<StringViolation> violations;
    const QList<uint> codePoints = raw.toUcs4();
    for (int i = 0; i < codePoints.size(); ++i) {
        const auto cp = static_cast<char32_t>(codePoints[i]);
        if (!allowed_(cp))
            violations.append(StringViolation{i, cp});
    }

    if (violations.isEmpty())
        return StringValidation::accepted(raw);

    BOOST_LOG_TRIVIAL(debug) << "CodePointPolicy: " << violations.size()
                             << " disallowed code point(s) in " << codePoints.size();
    return StringValidation::rejected(raw, std::move(violations));
}

ControlCharacterPolicy::ControlCharacterPolicy()
    : CodePointPolicy([](char32_t cp) {
          if (cp == U'\t' || cp == U'\n')
              return true;
          return QChar::category(cp) != QChar::Other_Control;
      })
{
}

} // namespace ngd
