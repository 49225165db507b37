#include "DatabaseManager.hpp"
#include <QSqlError>
#include <QStandardPaths>
#include <QDir>
#include <QDateTime>
#include <QDebug>
#include <QFileInfo>

DatabaseManager::DatabaseManager(const QString& db_path)
    : db_path_(db_path)
    , connection_name_("AutoSorterDB_" + QString::number(reinterpret_cast<quintptr>(this))) {
    if (db_path_.isEmpty()) {
        QString data_dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(data_dir);
        db_path_ = data_dir + "/auto_sorter.db";
    }
}

DatabaseManager::~DatabaseManager() {
    if (db_.isOpen()) {
        db_.close();
    }
    db_ = QSqlDatabase();
    if (QSqlDatabase::contains(connection_name_)) {
        QSqlDatabase::removeDatabase(connection_name_);
    }
}

bool DatabaseManager::initialize() {
    QDir().mkpath(QFileInfo(db_path_).absolutePath());
    
    db_ = QSqlDatabase::addDatabase("QSQLITE", connection_name_);
    db_.setDatabaseName(db_path_);
    
    if (!db_.open()) {
        qWarning() << "Failed to open database:" << db_.lastError().text();
        return false;
    }
    
    return create_tables();
}

bool DatabaseManager::is_open() const {
    return db_.isOpen();
}

bool DatabaseManager::create_tables() {
    QStringList queries;
    
    queries << R"(
        CREATE TABLE IF NOT EXISTS folder_decisions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            original_path TEXT NOT NULL,
            new_path TEXT NOT NULL,
            category TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            state TEXT NOT NULL CHECK (state IN ('active', 'undone', 'ignored'))
        )
    )";
    
    queries << R"(
        CREATE TABLE IF NOT EXISTS ignore_patterns (
            pattern TEXT PRIMARY KEY,
            source TEXT NOT NULL DEFAULT 'user',
            created INTEGER NOT NULL
        )
    )";
    
    for (const QString& query : queries) {
        if (!execute_query(query)) {
            return false;
        }
    }
    
    return true;
}

bool DatabaseManager::execute_query(const QString& query) {
    QSqlQuery q(db_);
    if (!q.exec(query)) {
        qWarning() << "Query failed:" << q.lastError().text();
        qWarning() << "Query:" << query;
        return false;
    }
    return true;
}

bool DatabaseManager::insert_decision(const Decision& decision, qint64& new_id) {
    QSqlQuery query(db_);
    query.prepare(R"(
        INSERT INTO folder_decisions
        (original_path, new_path, category, timestamp, state)
        VALUES (?, ?, ?, ?, ?)
    )");
    query.addBindValue(decision.original_path);
    query.addBindValue(decision.new_path);
    query.addBindValue(decision.category);
    query.addBindValue(decision.timestamp_ms);
    query.addBindValue(decision_state_name(decision.state));
    
    if (!query.exec()) {
        qWarning() << "Failed to save folder decision:" << query.lastError().text();
        return false;
    }
    new_id = query.lastInsertId().toLongLong();
    return true;
}

bool DatabaseManager::update_decision_state(qint64 id, DecisionState state) {
    QSqlQuery query(db_);
    query.prepare("UPDATE folder_decisions SET state = ? WHERE id = ?");
    query.addBindValue(decision_state_name(state));
    query.addBindValue(id);
    
    if (!query.exec()) {
        qWarning() << "Failed to update decision" << id << ":" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::remove_decision(qint64 id) {
    QSqlQuery query(db_);
    query.prepare("DELETE FROM folder_decisions WHERE id = ?");
    query.addBindValue(id);
    return query.exec();
}

std::vector<Decision> DatabaseManager::get_decisions() {
    std::vector<Decision> decisions;
    
    QSqlQuery query(db_);
    query.prepare(R"(
        SELECT id, original_path, new_path, category, timestamp, state
        FROM folder_decisions
        ORDER BY id
    )");
    
    if (query.exec()) {
        while (query.next()) {
            Decision d;
            d.id = query.value(0).toLongLong();
            d.original_path = query.value(1).toString();
            d.new_path = query.value(2).toString();
            d.category = query.value(3).toString();
            d.timestamp_ms = query.value(4).toLongLong();
            d.state = decision_state_from_name(query.value(5).toString());
            decisions.push_back(d);
        }
    } else {
        qWarning() << "Failed to load folder decisions:" << query.lastError().text();
    }
    
    return decisions;
}

bool DatabaseManager::add_ignore_pattern(const QString& pattern, const QString& source) {
    QSqlQuery query(db_);
    query.prepare(R"(
        INSERT OR IGNORE INTO ignore_patterns (pattern, source, created)
        VALUES (?, ?, ?)
    )");
    query.addBindValue(pattern);
    query.addBindValue(source);
    query.addBindValue(QDateTime::currentMSecsSinceEpoch());
    
    if (!query.exec()) {
        qWarning() << "Failed to save ignore pattern:" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::remove_ignore_pattern(const QString& pattern) {
    QSqlQuery query(db_);
    query.prepare("DELETE FROM ignore_patterns WHERE pattern = ?");
    query.addBindValue(pattern);
    return query.exec();
}

std::vector<IgnorePatternRow> DatabaseManager::get_ignore_patterns() {
    std::vector<IgnorePatternRow> rows;
    
    QSqlQuery query(db_);
    query.prepare("SELECT pattern, source, created FROM ignore_patterns ORDER BY created");
    
    if (query.exec()) {
        while (query.next()) {
            IgnorePatternRow row;
            row.pattern = query.value(0).toString();
            row.source = query.value(1).toString();
            row.created_ms = query.value(2).toLongLong();
            rows.push_back(row);
        }
    }
    
    return rows;
}
