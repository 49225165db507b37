#include "ConflictResolver.hpp"
#include <QDir>
#include <QFileInfo>

bool ConflictResolver::path_taken(const QString& path) {
    QFileInfo info(path);
    // Dangling symlinks report !exists() but still occupy the name.
    return info.exists() || info.isSymLink();
}

QString ConflictResolver::candidate_name(const QString& file_name, int counter, bool is_directory) {
    const QString tag = QString(" (%1)").arg(counter);
    if (is_directory) {
        return file_name + tag;
    }

    const int dot = file_name.lastIndexOf('.');
    if (dot <= 0) {
        return file_name + tag;
    }
    return file_name.left(dot) + tag + file_name.mid(dot);
}

bool ConflictResolver::resolve(const QString& desired_path, QString& free_path,
                               bool is_directory, int max_attempts) {
    if (!path_taken(desired_path)) {
        free_path = desired_path;
        return true;
    }

    const QFileInfo desired(desired_path);
    const QString dir_path = desired.absolutePath();
    const QString name = desired.fileName();
    QDir dir(dir_path);

    for (int counter = 1; counter <= max_attempts; ++counter) {
        const QString candidate = dir.filePath(candidate_name(name, counter, is_directory));
        if (!path_taken(candidate)) {
            free_path = candidate;
            return true;
        }
    }

    free_path.clear();
    return false;
}
