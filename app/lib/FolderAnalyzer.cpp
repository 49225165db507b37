#include "FolderAnalyzer.hpp"
#include "AppLogger.hpp"
#include "EngineTypes.hpp"
#include "RuleTree.hpp"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

FolderAnalyzer::FolderAnalyzer(int sample_cap)
    : sample_cap_(sample_cap > 0 ? sample_cap : kDefaultSampleCap) {
}

FolderAnalysis FolderAnalyzer::analyze(const QString& folder_path, const RuleTree& rules) const {
    FolderAnalysis analysis;

    // Symlinked subdirectories are not followed.
    QDirIterator it(folder_path,
                    QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot | QDir::System,
                    QDirIterator::Subdirectories);

    while (it.hasNext()) {
        if (analysis.sampled_files >= sample_cap_) {
            analysis.truncated = true;
            break;
        }
        const QString file_path = it.next();
        const QFileInfo info = it.fileInfo();
        ++analysis.sampled_files;

        if (!info.isReadable()) {
            continue;
        }

        const RuleMatch match = rules.match(file_path);
        const QString category = match.matched ? match.category : kDefaultCategory;

        CategoryTally& entry = analysis.tally[category];
        entry.count++;
        entry.total_bytes += info.size();
        analysis.classified_files++;
    }

    analysis.category = pick_dominant(analysis.tally);

    LOG_DEBUG("FolderAnalyzer", QString("%1: %2 sampled, %3 classified -> %4%5")
              .arg(folder_path)
              .arg(analysis.sampled_files)
              .arg(analysis.classified_files)
              .arg(analysis.category, analysis.truncated ? QString(" (sample cap reached)") : QString()));
    return analysis;
}

QString FolderAnalyzer::pick_dominant(const QMap<QString, CategoryTally>& tally) {
    QString best;
    CategoryTally best_tally;

    // QMap iterates keys in ascending order, so strict comparisons keep the
    // alphabetically first name on a full tie.
    for (auto it = tally.cbegin(); it != tally.cend(); ++it) {
        const CategoryTally& t = it.value();
        if (t.count <= 0) {
            continue;
        }
        const bool better = best.isEmpty()
            || t.count > best_tally.count
            || (t.count == best_tally.count && t.total_bytes > best_tally.total_bytes);
        if (better) {
            best = it.key();
            best_tally = t;
        }
    }

    return best.isEmpty() ? kDefaultCategory : best;
}
