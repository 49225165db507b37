#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "EngineTypes.hpp"
#include "FolderAnalyzer.hpp"
#include <QMutex>
#include <QString>
#include <QStringList>
#include <memory>

class IgnoreSet;
class RuleTree;

// Pure decision step: reads the filesystem, never changes it. Safe to call
// from pool threads; each call works against the rule tree that was current
// when it started.
class Classifier {
public:
    Classifier(std::shared_ptr<const RuleTree> rules,
               FolderHandlingMode folder_mode,
               int sample_cap,
               const IgnoreSet* ignore_set,
               QStringList transient_suffixes = default_transient_suffixes());

    ClassificationResult classify(const QString& path) const;

    void set_rule_tree(std::shared_ptr<const RuleTree> rules);
    std::shared_ptr<const RuleTree> rule_tree() const;

    void set_folder_handling_mode(FolderHandlingMode mode);
    FolderHandlingMode folder_handling_mode() const;

private:
    ClassificationResult classify_file(const QString& path, const RuleTree& rules) const;
    ClassificationResult classify_folder(const QString& path, const RuleTree& rules,
                                         FolderHandlingMode mode) const;
    static ClassificationResult skipped(const QString& reason, bool is_folder = false);

    mutable QMutex mutex_;
    std::shared_ptr<const RuleTree> rules_;
    FolderHandlingMode folder_mode_;
    FolderAnalyzer analyzer_;
    const IgnoreSet* ignore_set_;
    QStringList transient_suffixes_;
};

#endif // CLASSIFIER_HPP
