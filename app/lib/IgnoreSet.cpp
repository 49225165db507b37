#include "IgnoreSet.hpp"
#include <QDir>
#include <QFileInfo>

namespace {

QString normalized(const QString& path) {
    QString clean = QDir::cleanPath(QDir::fromNativeSeparators(path.trimmed()));
    while (clean.size() > 1 && clean.endsWith('/')) {
        clean.chop(1);
    }
    return clean;
}

} // namespace

IgnoreSet::IgnoreSet(const QStringList& patterns) {
    replace_all(patterns);
}

bool IgnoreSet::make_entry(const QString& pattern, Entry& out) {
    const QString clean = normalized(pattern);
    if (clean.isEmpty() || clean == ".") {
        return false;
    }

    out.pattern = clean;
    out.absolute = QDir::isAbsolutePath(clean);
    out.wildcard = clean.contains('*') || clean.contains('?') || clean.contains('[');
    if (out.wildcard) {
        out.regex = QRegularExpression(QRegularExpression::wildcardToRegularExpression(clean));
        if (!out.regex.isValid()) {
            return false;
        }
    }
    return true;
}

bool IgnoreSet::add(const QString& pattern) {
    Entry entry;
    if (!make_entry(pattern, entry)) {
        return false;
    }

    QWriteLocker locker(&lock_);
    for (const Entry& existing : entries_) {
        if (existing.pattern == entry.pattern) {
            return false;
        }
    }
    entries_.push_back(std::move(entry));
    return true;
}

bool IgnoreSet::remove(const QString& pattern) {
    const QString clean = normalized(pattern);
    QWriteLocker locker(&lock_);
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->pattern == clean) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

void IgnoreSet::replace_all(const QStringList& patterns) {
    std::vector<Entry> fresh;
    for (const QString& pattern : patterns) {
        Entry entry;
        if (make_entry(pattern, entry)) {
            fresh.push_back(std::move(entry));
        }
    }

    QWriteLocker locker(&lock_);
    entries_ = std::move(fresh);
}

bool IgnoreSet::contains_pattern(const QString& pattern) const {
    const QString clean = normalized(pattern);
    QReadLocker locker(&lock_);
    for (const Entry& entry : entries_) {
        if (entry.pattern == clean) {
            return true;
        }
    }
    return false;
}

QStringList IgnoreSet::patterns() const {
    QReadLocker locker(&lock_);
    QStringList out;
    for (const Entry& entry : entries_) {
        out.append(entry.pattern);
    }
    return out;
}

int IgnoreSet::size() const {
    QReadLocker locker(&lock_);
    return static_cast<int>(entries_.size());
}

bool IgnoreSet::matches(const QString& path) const {
    const QString clean = normalized(path);
    const QString name = QFileInfo(clean).fileName();

    QReadLocker locker(&lock_);
    for (const Entry& entry : entries_) {
        if (entry.absolute) {
            if (entry.wildcard) {
                if (entry.regex.match(clean).hasMatch()) {
                    return true;
                }
            } else if (clean == entry.pattern || clean.startsWith(entry.pattern + '/')) {
                return true;
            }
            continue;
        }

        if (entry.wildcard) {
            if (entry.regex.match(name).hasMatch()) {
                return true;
            }
        } else if (name == entry.pattern) {
            return true;
        }
    }
    return false;
}
