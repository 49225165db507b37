#include "Classifier.hpp"
#include "IgnoreSet.hpp"
#include "RuleTree.hpp"
#include <QFile>
#include <QFileInfo>

Classifier::Classifier(std::shared_ptr<const RuleTree> rules,
                       FolderHandlingMode folder_mode,
                       int sample_cap,
                       const IgnoreSet* ignore_set,
                       QStringList transient_suffixes)
    : rules_(rules ? std::move(rules) : std::make_shared<const RuleTree>())
    , folder_mode_(folder_mode)
    , analyzer_(sample_cap)
    , ignore_set_(ignore_set)
    , transient_suffixes_(std::move(transient_suffixes)) {
}

void Classifier::set_rule_tree(std::shared_ptr<const RuleTree> rules) {
    if (!rules) {
        return;
    }
    QMutexLocker locker(&mutex_);
    rules_ = std::move(rules);
}

std::shared_ptr<const RuleTree> Classifier::rule_tree() const {
    QMutexLocker locker(&mutex_);
    return rules_;
}

void Classifier::set_folder_handling_mode(FolderHandlingMode mode) {
    QMutexLocker locker(&mutex_);
    folder_mode_ = mode;
}

FolderHandlingMode Classifier::folder_handling_mode() const {
    QMutexLocker locker(&mutex_);
    return folder_mode_;
}

ClassificationResult Classifier::skipped(const QString& reason, bool is_folder) {
    ClassificationResult result;
    result.skip = true;
    result.skip_reason = reason;
    result.is_folder = is_folder;
    return result;
}

ClassificationResult Classifier::classify(const QString& path) const {
    std::shared_ptr<const RuleTree> rules;
    FolderHandlingMode mode;
    {
        QMutexLocker locker(&mutex_);
        rules = rules_;
        mode = folder_mode_;
    }

    if (ignore_set_ && ignore_set_->matches(path)) {
        return skipped("path is in the ignore set");
    }

    QFileInfo info(path);
    if (!info.exists()) {
        return skipped("path no longer exists");
    }
    if (info.isSymLink()) {
        return skipped("symbolic links are left alone");
    }

    if (info.isDir()) {
        return classify_folder(path, *rules, mode);
    }
    return classify_file(path, *rules);
}

ClassificationResult Classifier::classify_file(const QString& path, const RuleTree& rules) const {
    QFileInfo info(path);

    if (has_transient_suffix(info.fileName(), transient_suffixes_)) {
        return skipped(info.size() == 0 ? "empty transient download artifact"
                                        : "download still in progress");
    }

    QFile reader(path);
    if (!reader.open(QIODevice::ReadOnly)) {
        return skipped(QString("unreadable: %1").arg(reader.errorString()));
    }
    reader.close();

    ClassificationResult result;
    const RuleMatch match = rules.match(path);
    if (match.matched) {
        result.category = match.category;
        result.subcategory = match.subcategory;
    } else {
        result.category = kDefaultCategory;
    }
    return result;
}

ClassificationResult Classifier::classify_folder(const QString& path, const RuleTree& rules,
                                                 FolderHandlingMode mode) const {
    ClassificationResult result;
    result.is_folder = true;

    switch (mode) {
        case FolderHandlingMode::Ignore:
            return skipped("folder handling is set to ignore", true);
        case FolderHandlingMode::MoveToOthers:
            result.category = kDefaultCategory;
            return result;
        case FolderHandlingMode::SmartScan: {
            const FolderAnalysis analysis = analyzer_.analyze(path, rules);
            result.category = analysis.category;
            return result;
        }
    }
    return skipped("unknown folder handling mode", true);
}
