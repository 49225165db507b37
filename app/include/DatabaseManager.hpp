#ifndef DATABASE_MANAGER_HPP
#define DATABASE_MANAGER_HPP

#include "EngineTypes.hpp"
#include <QString>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QStringList>
#include <vector>

struct IgnorePatternRow {
    QString pattern;
    QString source;     // "config" or "user"
    qint64 created_ms;
};

// SQLite store for folder decisions and user ignore patterns. A connection is
// bound to the thread that called initialize(); use it from that thread only.
class DatabaseManager {
public:
    explicit DatabaseManager(const QString& db_path = "");
    ~DatabaseManager();
    
    bool initialize();
    bool is_open() const;
    QString database_path() const { return db_path_; }
    
    // Folder decisions
    bool insert_decision(const Decision& decision, qint64& new_id);
    bool update_decision_state(qint64 id, DecisionState state);
    bool remove_decision(qint64 id);
    std::vector<Decision> get_decisions();
    
    // Ignore patterns
    bool add_ignore_pattern(const QString& pattern, const QString& source);
    bool remove_ignore_pattern(const QString& pattern);
    std::vector<IgnorePatternRow> get_ignore_patterns();
    
private:
    QSqlDatabase db_;
    QString db_path_;
    QString connection_name_;
    
    bool create_tables();
    bool execute_query(const QString& query);
};

#endif // DATABASE_MANAGER_HPP
