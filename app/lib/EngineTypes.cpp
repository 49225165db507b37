#include "EngineTypes.hpp"

QString engine_error_name(EngineError error) {
    switch (error) {
        case EngineError::None:                  return "None";
        case EngineError::WatchUnavailable:      return "WatchUnavailable";
        case EngineError::ClassificationSkipped: return "ClassificationSkipped";
        case EngineError::ConflictExhausted:     return "ConflictExhausted";
        case EngineError::MoveFailed:            return "MoveFailed";
        case EngineError::UndoConflict:          return "UndoConflict";
        case EngineError::NotFound:              return "NotFound";
        default:                                 return "???";
    }
}

bool parse_folder_handling_mode(const QString& text, FolderHandlingMode& mode) {
    const QString key = text.trimmed().toLower();
    if (key == "smart_scan" || key == "smartscan") {
        mode = FolderHandlingMode::SmartScan;
        return true;
    }
    if (key == "move_to_others" || key == "movetoothers") {
        mode = FolderHandlingMode::MoveToOthers;
        return true;
    }
    if (key == "ignore") {
        mode = FolderHandlingMode::Ignore;
        return true;
    }
    return false;
}

QString folder_handling_mode_name(FolderHandlingMode mode) {
    switch (mode) {
        case FolderHandlingMode::SmartScan:    return "smart_scan";
        case FolderHandlingMode::MoveToOthers: return "move_to_others";
        case FolderHandlingMode::Ignore:       return "ignore";
        default:                               return "smart_scan";
    }
}

QString decision_state_name(DecisionState state) {
    switch (state) {
        case DecisionState::Active:       return "active";
        case DecisionState::UndoneByUser: return "undone";
        case DecisionState::Ignored:      return "ignored";
        default:                          return "active";
    }
}

DecisionState decision_state_from_name(const QString& name) {
    if (name == "undone") {
        return DecisionState::UndoneByUser;
    }
    if (name == "ignored") {
        return DecisionState::Ignored;
    }
    return DecisionState::Active;
}

QStringList default_transient_suffixes() {
    return {
        ".crdownload",   // Chromium based browsers
        ".part",         // Firefox, wget
        ".partial",      // older Firefox / IE
        ".download",     // Safari
        ".opdownload",   // Opera
        ".!qb",          // qBittorrent
        ".tmp"
    };
}

bool has_transient_suffix(const QString& file_name, const QStringList& suffixes) {
    for (const QString& suffix : suffixes) {
        if (!suffix.isEmpty() && file_name.endsWith(suffix, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}
