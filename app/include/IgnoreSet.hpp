#ifndef IGNORE_SET_HPP
#define IGNORE_SET_HPP

#include <QReadWriteLock>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <vector>

// Paths and name patterns the engine must never touch. Shared between the
// watcher thread and the classification pool, so every method locks.
//
// Pattern forms:
//   "/abs/path"        the path itself and everything below it
//   "/abs/*/glob"      full-path wildcard
//   "desktop.ini"      file or folder name, wildcards allowed ("*.log")
class IgnoreSet {
public:
    IgnoreSet() = default;
    explicit IgnoreSet(const QStringList& patterns);

    bool add(const QString& pattern);
    bool remove(const QString& pattern);
    void replace_all(const QStringList& patterns);
    bool contains_pattern(const QString& pattern) const;
    QStringList patterns() const;
    int size() const;

    bool matches(const QString& path) const;

private:
    struct Entry {
        QString pattern;
        bool absolute = false;
        bool wildcard = false;
        QRegularExpression regex;
    };

    static bool make_entry(const QString& pattern, Entry& out);

    mutable QReadWriteLock lock_;
    std::vector<Entry> entries_;
};

#endif // IGNORE_SET_HPP
