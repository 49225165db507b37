#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "EngineTypes.hpp"
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <memory>

class RuleTree;

struct EngineConfig {
    QStringList target_folders;
    int cooldown_ms = 5000;
    FolderHandlingMode folder_mode = FolderHandlingMode::SmartScan;
    int decision_retention = 50;
    int sample_cap = 200;
    QStringList ignore_list;
    QStringList transient_suffixes = default_transient_suffixes();
    int worker_threads = 0;                  // 0: QThread::idealThreadCount()
    int notification_capacity = 256;
    int move_record_capacity = 1024;
    QString database_path;                   // empty: app-data auto_sorter.db
    QString log_level = "info";
    QString log_file;
    std::shared_ptr<const RuleTree> rules;   // never null after a successful load
};

class ConfigLoader {
public:
    static bool load_file(const QString& path, EngineConfig& config, QString& error_message,
                          QStringList* warnings = nullptr);
    static bool parse(const QJsonObject& root, EngineConfig& config, QString& error_message,
                      QStringList* warnings = nullptr);
    static bool validate(const EngineConfig& config, QString& error_message, QStringList* warnings = nullptr);

    // {USER_DOWNLOADS} and {HOME}; "~/" is treated as {HOME}/.
    static QString expand_placeholders(const QString& path);
};

#endif // CONFIG_LOADER_HPP
