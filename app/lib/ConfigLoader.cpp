#include "ConfigLoader.hpp"
#include "AppLogger.hpp"
#include "RuleTree.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr int kMaxInt = std::numeric_limits<int>::max();

bool read_positive_int(const QJsonObject& root, const QString& key, int& out, QString& error_message) {
    if (!root.contains(key)) {
        return true;
    }
    const QJsonValue value = root.value(key);
    if (!value.isDouble() || value.toDouble() < 1 || value.toDouble() != std::floor(value.toDouble())
        || value.toDouble() > kMaxInt) {
        error_message = QString("'%1' must be a positive whole number up to %2").arg(key).arg(kMaxInt);
        return false;
    }
    out = value.toInt();
    return true;
}

QStringList string_list(const QJsonValue& value) {
    QStringList out;
    for (const QJsonValue& item : value.toArray()) {
        if (item.isString() && !item.toString().trimmed().isEmpty()) {
            out.append(item.toString().trimmed());
        }
    }
    return out;
}

} // namespace

QString ConfigLoader::expand_placeholders(const QString& path) {
    QString out = path.trimmed();
    if (out.contains("{USER_DOWNLOADS}")) {
        QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
        if (downloads.isEmpty()) {
            downloads = QDir::home().filePath("Downloads");
        }
        out.replace("{USER_DOWNLOADS}", downloads);
    }
    out.replace("{HOME}", QDir::homePath());
    if (out == "~" || out.startsWith("~/")) {
        out.replace(0, 1, QDir::homePath());
    }
    return out;
}

bool ConfigLoader::load_file(const QString& path, EngineConfig& config, QString& error_message,
                             QStringList* warnings) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error_message = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        error_message = QString("%1: %2 at offset %3")
                            .arg(path, parse_error.errorString()).arg(parse_error.offset);
        return false;
    }
    if (!doc.isObject()) {
        error_message = QString("%1: top level must be an object").arg(path);
        return false;
    }

    if (!parse(doc.object(), config, error_message, warnings)) {
        return false;
    }
    LOG_INFO("Config", QString("Loaded %1 (%2 root(s))").arg(path).arg(config.target_folders.size()));
    return true;
}

bool ConfigLoader::parse(const QJsonObject& root, EngineConfig& config, QString& error_message,
                         QStringList* warnings) {
    EngineConfig parsed;

    // Roots
    QStringList folders;
    if (root.contains("target_folders")) {
        if (!root.value("target_folders").isArray()) {
            error_message = "'target_folders' must be a list of paths";
            return false;
        }
        folders = string_list(root.value("target_folders"));
    } else if (root.value("target_folder").isString()) {
        folders.append(root.value("target_folder").toString());
    }
    for (const QString& folder : folders) {
        const QString expanded = QDir::cleanPath(expand_placeholders(folder));
        if (!parsed.target_folders.contains(expanded)) {
            parsed.target_folders.append(expanded);
        }
    }

    if (root.contains("cooldown_period_seconds")) {
        const QJsonValue value = root.value("cooldown_period_seconds");
        const double max_seconds = kMaxInt / 1000;
        if (!value.isDouble() || value.toDouble() <= 0 || value.toDouble() > max_seconds) {
            error_message = QString("'cooldown_period_seconds' must be a positive number up to %1")
                                .arg(max_seconds, 0, 'f', 0);
            return false;
        }
        parsed.cooldown_ms = std::max(1, static_cast<int>(std::lround(value.toDouble() * 1000.0)));
    }

    if (root.contains("folder_handling_strategy")) {
        const QString text = root.value("folder_handling_strategy").toString();
        if (!parse_folder_handling_mode(text, parsed.folder_mode)) {
            error_message = QString("Unknown folder_handling_strategy '%1'").arg(text);
            return false;
        }
    }

    if (!read_positive_int(root, "decision_retention_count", parsed.decision_retention, error_message)
        || !read_positive_int(root, "sample_cap_per_folder", parsed.sample_cap, error_message)
        || !read_positive_int(root, "worker_threads", parsed.worker_threads, error_message)
        || !read_positive_int(root, "notification_capacity", parsed.notification_capacity, error_message)
        || !read_positive_int(root, "move_record_capacity", parsed.move_record_capacity, error_message)) {
        return false;
    }

    for (const QString& pattern : string_list(root.value("ignore_list"))) {
        parsed.ignore_list.append(expand_placeholders(pattern));
    }

    if (root.contains("transient_suffixes")) {
        parsed.transient_suffixes.clear();
        for (QString suffix : string_list(root.value("transient_suffixes"))) {
            suffix = suffix.toLower();
            if (!suffix.startsWith('.')) {
                suffix.prepend('.');
            }
            parsed.transient_suffixes.append(suffix);
        }
    }

    if (root.value("database_path").isString()) {
        parsed.database_path = expand_placeholders(root.value("database_path").toString());
    }
    if (root.value("log_file").isString()) {
        parsed.log_file = expand_placeholders(root.value("log_file").toString());
    }
    if (root.contains("log_level")) {
        LogSeverity severity;
        parsed.log_level = root.value("log_level").toString();
        if (!AppLogger::parse_severity(parsed.log_level, severity)) {
            error_message = QString("Unknown log_level '%1'").arg(parsed.log_level);
            return false;
        }
    }

    const QJsonValue rules = root.value("rules");
    if (rules.isArray()) {
        parsed.rules = RuleTree::from_json_array(rules.toArray(), warnings);
    } else if (rules.isObject()) {
        parsed.rules = RuleTree::from_json_object(rules.toObject(), warnings);
    } else if (rules.isUndefined() || rules.isNull()) {
        parsed.rules = RuleTree::default_tree();
    } else {
        error_message = "'rules' must be an object or a list";
        return false;
    }
    if (parsed.rules->empty()) {
        error_message = "No usable rules in 'rules'";
        return false;
    }

    if (!validate(parsed, error_message, warnings)) {
        return false;
    }

    if (warnings) {
        for (const QString& warning : *warnings) {
            LOG_WARN("Config", warning);
        }
    }
    config = parsed;
    return true;
}

bool ConfigLoader::validate(const EngineConfig& config, QString& error_message, QStringList* warnings) {
    if (config.target_folders.isEmpty()) {
        error_message = "No target folder configured";
        return false;
    }

    int existing = 0;
    for (const QString& folder : config.target_folders) {
        if (!QDir::isAbsolutePath(folder)) {
            error_message = QString("Target folder must be an absolute path: %1").arg(folder);
            return false;
        }
        if (QFileInfo(folder).isDir()) {
            ++existing;
        } else if (warnings) {
            warnings->append(QString("Target folder does not exist yet: %1").arg(folder));
        }
    }
    if (existing == 0) {
        error_message = "None of the target folders exist";
        return false;
    }
    return true;
}
