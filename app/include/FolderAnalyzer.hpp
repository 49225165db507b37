#ifndef FOLDER_ANALYZER_HPP
#define FOLDER_ANALYZER_HPP

#include <QMap>
#include <QString>

class RuleTree;

struct CategoryTally {
    int count = 0;
    qint64 total_bytes = 0;
};

struct FolderAnalysis {
    QString category;
    int sampled_files = 0;
    int classified_files = 0;
    bool truncated = false;                // sample cap reached before the walk finished
    QMap<QString, CategoryTally> tally;
};

// Read-only: walks a directory, never moves or renames anything.
class FolderAnalyzer {
public:
    static constexpr int kDefaultSampleCap = 200;

    explicit FolderAnalyzer(int sample_cap = kDefaultSampleCap);

    FolderAnalysis analyze(const QString& folder_path, const RuleTree& rules) const;

    // Plurality by count, then by total bytes, then alphabetical.
    static QString pick_dominant(const QMap<QString, CategoryTally>& tally);

    int sample_cap() const { return sample_cap_; }

private:
    int sample_cap_;
};

#endif // FOLDER_ANALYZER_HPP
