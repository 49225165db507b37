#ifndef ENGINE_TYPES_HPP
#define ENGINE_TYPES_HPP

#include <QMetaType>
#include <QString>
#include <QStringList>

enum class EngineError {
    None,
    WatchUnavailable,
    ClassificationSkipped,
    ConflictExhausted,
    MoveFailed,
    UndoConflict,
    NotFound
};

QString engine_error_name(EngineError error);

// Renames are delivered as Removed(old) followed by Created(new).
enum class FsEventKind {
    Created,
    Modified,
    Removed
};

struct FsEvent {
    QString path;
    FsEventKind kind = FsEventKind::Created;
    qint64 timestamp_ms = 0;
};

enum class FolderHandlingMode {
    SmartScan,
    MoveToOthers,
    Ignore
};

bool parse_folder_handling_mode(const QString& text, FolderHandlingMode& mode);
QString folder_handling_mode_name(FolderHandlingMode mode);

struct MoveRecord {
    QString source_path;
    QString destination_path;
    QString category;
    QString subcategory;
    qint64 timestamp_ms = 0;
    bool is_folder = false;
};

enum class DecisionState {
    Active,
    UndoneByUser,
    Ignored
};

QString decision_state_name(DecisionState state);
DecisionState decision_state_from_name(const QString& name);

struct Decision {
    qint64 id = 0;
    QString original_path;
    QString new_path;
    QString category;
    qint64 timestamp_ms = 0;
    DecisionState state = DecisionState::Active;
};

struct ClassificationResult {
    bool skip = false;
    QString skip_reason;
    QString category;
    QString subcategory;
    bool is_folder = false;
};

// Partial-download markers. Entries are lower-case and dot-prefixed.
QStringList default_transient_suffixes();
bool has_transient_suffix(const QString& file_name, const QStringList& suffixes);

inline const QString kDefaultCategory = QStringLiteral("Others");

Q_DECLARE_METATYPE(FsEvent)
Q_DECLARE_METATYPE(MoveRecord)
Q_DECLARE_METATYPE(Decision)

#endif // ENGINE_TYPES_HPP
