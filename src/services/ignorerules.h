/**
 * @file ignorerules.h
 * @brief Exclusion patterns for tree synchronization.
 */

#ifndef IGNORERULES_H
#define IGNORERULES_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief A single exclusion pattern.
 *
 * A pattern containing '/' is a path rule: it is normalized like a remote
 * path and matches that path and everything below it ("/www/private"
 * matches "/www/private/x" but not "/www/private2"). Any other pattern is a
 * name rule and matches entries whose file name starts or ends with it
 * ("node_modules" matches "my_node_modules" but not "modules").
 */
class IgnoreRule
{
public:
    enum class Kind { Path, Name };

    /**
     * @brief Builds a rule from user input. Surrounding whitespace is ignored.
     */
    explicit IgnoreRule(const QString &pattern);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] QString pattern() const { return pattern_; }
    [[nodiscard]] bool isValid() const { return !pattern_.isEmpty(); }

    /**
     * @brief Tests a remote path (normalized before matching).
     */
    [[nodiscard]] bool matches(const QString &remotePath) const;

private:
    Kind kind_ = Kind::Name;
    QString pattern_;
};

/**
 * @brief Ordered collection of rules; a path is ignored if any rule matches.
 */
class IgnoreRuleSet
{
public:
    IgnoreRuleSet() = default;

    /**
     * @brief Builds a set from raw patterns; blank patterns are dropped.
     */
    explicit IgnoreRuleSet(const QStringList &patterns);

    void add(const QString &pattern);

    [[nodiscard]] bool isIgnored(const QString &remotePath) const;
    [[nodiscard]] bool isEmpty() const { return rules_.isEmpty(); }
    [[nodiscard]] int size() const { return static_cast<int>(rules_.size()); }
    [[nodiscard]] const QList<IgnoreRule> &rules() const { return rules_; }

    /// @brief Patterns as entered (after trimming), e.g. for persisting
    [[nodiscard]] QStringList patterns() const;

private:
    QList<IgnoreRule> rules_;
};

#endif // IGNORERULES_H
