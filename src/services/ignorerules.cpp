#include "ignorerules.h"

#include "remotepath.h"

IgnoreRule::IgnoreRule(const QString &pattern)
{
    const QString trimmed = pattern.trimmed();
    if (trimmed.contains(QLatin1Char('/')) || trimmed.contains(QLatin1Char('\\'))) {
        kind_ = Kind::Path;
        pattern_ = RemotePath::normalize(trimmed);
    } else {
        kind_ = Kind::Name;
        pattern_ = trimmed;
    }
}

bool IgnoreRule::matches(const QString &remotePath) const
{
    if (pattern_.isEmpty()) {
        return false;
    }

    const QString path = RemotePath::normalize(remotePath);
    if (kind_ == Kind::Path) {
        return RemotePath::isWithin(path, pattern_);
    }

    const QString name = RemotePath::fileName(path);
    return name.startsWith(pattern_) || name.endsWith(pattern_);
}

IgnoreRuleSet::IgnoreRuleSet(const QStringList &patterns)
{
    for (const QString &pattern : patterns) {
        add(pattern);
    }
}

void IgnoreRuleSet::add(const QString &pattern)
{
    IgnoreRule rule(pattern);
    if (rule.isValid()) {
        rules_.append(rule);
    }
}

bool IgnoreRuleSet::isIgnored(const QString &remotePath) const
{
    for (const IgnoreRule &rule : rules_) {
        if (rule.matches(remotePath)) {
            return true;
        }
    }
    return false;
}

QStringList IgnoreRuleSet::patterns() const
{
    QStringList result;
    for (const IgnoreRule &rule : rules_) {
        result.append(rule.pattern());
    }
    return result;
}
