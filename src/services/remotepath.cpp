#include "remotepath.h"

namespace RemotePath {

QString normalize(const QString &path)
{
    QString out = path;
    out.replace('\\', '/');

    const QStringList parts = out.split('/', Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return QStringLiteral("/");
    }
    return '/' + parts.join('/');
}

QString join(const QString &base, const QString &name)
{
    QString combined = base;
    combined.replace('\\', '/');
    if (!name.isEmpty()) {
        if (name.startsWith('/')) {
            // posix.join treats a leading slash in later segments as a separator
            combined += name;
        } else {
            combined += '/' + name;
        }
    }

    QStringList resolved;
    for (const QString &segment : combined.split('/', Qt::SkipEmptyParts)) {
        if (segment == QLatin1String(".")) {
            continue;
        }
        if (segment == QLatin1String("..")) {
            if (!resolved.isEmpty()) {
                resolved.removeLast();
            }
            continue;
        }
        resolved.append(segment);
    }
    return '/' + resolved.join('/');
}

QString parent(const QString &path)
{
    const QString normalized = normalize(path);
    const int idx = normalized.lastIndexOf('/');
    if (idx <= 0) {
        return QStringLiteral("/");
    }
    return normalized.left(idx);
}

QString fileName(const QString &path)
{
    const QString normalized = normalize(path);
    return normalized.mid(normalized.lastIndexOf('/') + 1);
}

QStringList segments(const QString &path)
{
    QString out = path;
    out.replace('\\', '/');
    return out.split('/', Qt::SkipEmptyParts);
}

bool isRoot(const QString &path)
{
    return path.isEmpty() || normalize(path) == QLatin1String("/");
}

bool isWithin(const QString &path, const QString &ancestor)
{
    const QString p = normalize(path);
    const QString a = normalize(ancestor);
    if (a == QLatin1String("/")) {
        return true;
    }
    return p == a || p.startsWith(a + '/');
}

} // namespace RemotePath
