#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include <QString>

// Picks a destination that does not exist yet. Never creates anything on disk,
// so the answer is only valid until the caller's rename.
class ConflictResolver {
public:
    static constexpr int kMaxAttempts = 1000;

    // Returns false when every candidate up to max_attempts is taken.
    static bool resolve(const QString& desired_path, QString& free_path,
                        bool is_directory = false, int max_attempts = kMaxAttempts);

    // "name.ext" -> "name (n).ext"; directories and extensionless names get "name (n)".
    static QString candidate_name(const QString& file_name, int counter, bool is_directory);

    static bool path_taken(const QString& path);
};

#endif // CONFLICT_RESOLVER_HPP
