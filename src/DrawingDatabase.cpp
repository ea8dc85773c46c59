#include "DrawingDatabase.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QUuid>
#include <QVariant>
#include <QDebug>

static std::string idString(const QVariant &v) {
    return v.isNull() ? std::string() : QString::number(v.toLongLong()).toStdString();
}

static qlonglong parseId(const std::string &id, const char *kind) {
    bool ok = false;
    qlonglong v = QString::fromStdString(id).toLongLong(&ok);
    if (!ok) throw SourceError(std::string("invalid ") + kind + " id '" + id + "'");
    return v;
}

static void execOrThrow(QSqlQuery &query, const char *what) {
    if (!query.exec()) {
        throw SourceError(std::string(what) + ": " +
                          query.lastError().text().toStdString());
    }
}

static double readNumber(const QSqlQuery &query, int col, const char *field,
                         const std::string &itemId) {
    QVariant v = query.value(col);
    if (v.isNull())
        throw SourceError("item " + itemId + ": " + field + " is missing");
    bool ok = false;
    double d = v.toDouble(&ok);
    if (!ok) {
        throw SourceError("item " + itemId + ": " + field + " is not a number ('" +
                          v.toString().toStdString() + "')");
    }
    return d;
}

DrawingDatabase::DrawingDatabase()
    : m_connectionName(QStringLiteral("drawing-") + QUuid::createUuid().toString()) {
}

DrawingDatabase::~DrawingDatabase() {
    close();
}

bool DrawingDatabase::open(const QString &fileName, OpenMode mode) {
    if (m_db.isOpen()) {
        if (m_mode == mode && m_db.databaseName() == fileName) return true;
        close();
    }
    m_lastError.clear();
    m_mode = mode;
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(fileName);
    if (mode == ReadOnly)
        m_db.setConnectOptions("QSQLITE_OPEN_READONLY");
    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        qWarning() << "Failed to open drawing" << fileName << ":" << m_lastError;
        close();
        return false;
    }
    if (mode == ReadWrite && !createSchema()) {
        close();
        return false;
    }
    return true;
}

bool DrawingDatabase::createSchema() {
    if (!m_db.isOpen()) return false;
    QSqlQuery query(m_db);
    const char *sql[] = {
        "CREATE TABLE IF NOT EXISTS alignments("
        "id INTEGER PRIMARY KEY,"
        "name TEXT NOT NULL)",

        // a material list belongs to at most one alignment
        "CREATE TABLE IF NOT EXISTS material_lists("
        "id INTEGER PRIMARY KEY,"
        "alignment_id INTEGER,"
        "name TEXT)",

        "CREATE TABLE IF NOT EXISTS material_list_items("
        "id INTEGER PRIMARY KEY,"
        "list_id INTEGER,"
        "name TEXT)",

        // one row per sampled station range
        "CREATE TABLE IF NOT EXISTS material_quantities("
        "id INTEGER PRIMARY KEY,"
        "item_id INTEGER,"
        "start_station REAL,"
        "end_station REAL,"
        "cut_volume REAL,"
        "fill_volume REAL)"
    };

    for (auto stmt : sql) {
        if (!query.exec(stmt)) {
            m_lastError = query.lastError().text();
            qWarning() << "Schema creation failed:" << m_lastError;
            return false;
        }
    }
    return true;
}

void DrawingDatabase::close() {
    if (m_db.isValid()) {
        m_db.close();
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool DrawingDatabase::isOpen() const {
    return m_db.isOpen();
}

QSqlDatabase DrawingDatabase::database() const {
    return m_db;
}

QString DrawingDatabase::lastError() const {
    return m_lastError;
}

std::vector<Alignment> DrawingDatabase::alignments() const {
    std::vector<Alignment> result;
    m_lastError.clear();
    QSqlQuery query(m_db);
    query.prepare("SELECT id, name FROM alignments ORDER BY id");
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        qWarning() << "Failed to query alignments:" << m_lastError;
        return result;
    }
    while (query.next())
        result.push_back({idString(query.value(0)), query.value(1).toString().toStdString()});
    return result;
}

std::optional<Alignment> DrawingDatabase::findAlignment(const QString &idOrName) const {
    if (auto byId = alignment(idOrName.toStdString())) return byId;

    QSqlQuery query(m_db);
    query.prepare("SELECT id, name FROM alignments WHERE name = :name ORDER BY id");
    query.bindValue(":name", idOrName);
    execOrThrow(query, "alignment lookup");
    if (!query.next()) return std::nullopt;
    return Alignment{idString(query.value(0)), query.value(1).toString().toStdString()};
}

std::string DrawingDatabase::resolveAlignmentId(const QString &requested) const {
    if (auto a = findAlignment(requested)) return a->id;
    return requested.toStdString();
}

std::optional<Alignment> DrawingDatabase::alignment(const std::string& id) const {
    bool ok = false;
    qlonglong key = QString::fromStdString(id).toLongLong(&ok);
    if (!ok) return std::nullopt;

    QSqlQuery query(m_db);
    query.prepare("SELECT id, name FROM alignments WHERE id = :id");
    query.bindValue(":id", key);
    execOrThrow(query, "alignment lookup");
    if (!query.next()) return std::nullopt;
    return Alignment{idString(query.value(0)), query.value(1).toString().toStdString()};
}

std::vector<MaterialRecord> DrawingDatabase::listMaterialLists() const {
    std::vector<MaterialRecord> result;
    QSqlQuery query(m_db);
    query.prepare("SELECT id, name, alignment_id FROM material_lists ORDER BY id");
    execOrThrow(query, "material lists");
    while (query.next()) {
        result.push_back({idString(query.value(0)),
                          query.value(1).toString().toStdString(),
                          idString(query.value(2))});
    }
    return result;
}

std::vector<ItemRecord> DrawingDatabase::listItems(const MaterialRecord& list) const {
    std::vector<ItemRecord> result;
    QSqlQuery query(m_db);
    query.prepare("SELECT id, name FROM material_list_items WHERE list_id = :list ORDER BY id");
    query.bindValue(":list", parseId(list.id, "material list"));
    execOrThrow(query, "material list items");
    while (query.next())
        result.push_back({idString(query.value(0)), query.value(1).toString().toStdString()});
    return result;
}

std::vector<QuantityRecord> DrawingDatabase::listQuantities(const ItemRecord& item) const {
    std::vector<QuantityRecord> result;
    QSqlQuery query(m_db);
    query.prepare("SELECT start_station, end_station, cut_volume, fill_volume "
                  "FROM material_quantities WHERE item_id = :item ORDER BY id");
    query.bindValue(":item", parseId(item.id, "material list item"));
    execOrThrow(query, "material quantities");
    while (query.next()) {
        QuantityRecord q;
        q.stationStart = readNumber(query, 0, "start_station", item.id);
        q.stationEnd   = readNumber(query, 1, "end_station", item.id);
        q.cutVolume    = readNumber(query, 2, "cut_volume", item.id);
        q.fillVolume   = readNumber(query, 3, "fill_volume", item.id);
        result.push_back(q);
    }
    return result;
}

// ─── ReadScope ────────────────────────────────────────────────────────────────
DrawingDatabase::ReadScope::ReadScope(DrawingDatabase &db)
    : m_db(db), m_active(false) {
    QSqlDatabase handle = m_db.database();
    m_active = handle.isOpen() && handle.transaction();
    if (!m_active && handle.isOpen())
        qWarning() << "Could not start read transaction:" << handle.lastError().text();
}

DrawingDatabase::ReadScope::~ReadScope() {
    if (m_active) m_db.database().rollback();
}
