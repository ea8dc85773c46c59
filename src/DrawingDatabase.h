#ifndef DRAWINGDATABASE_H
#define DRAWINGDATABASE_H

#include "MaterialListSource.h"
#include <QSqlDatabase>
#include <QString>
#include <vector>

// Drawing stored as SQLite: alignments, material lists, their items and the
// per-station quantities. One connection per instance.
class DrawingDatabase : public MaterialListSource {
public:
    enum OpenMode { ReadOnly, ReadWrite };

    DrawingDatabase();
    ~DrawingDatabase() override;

    DrawingDatabase(const DrawingDatabase&) = delete;
    DrawingDatabase& operator=(const DrawingDatabase&) = delete;

    /// ReadWrite creates the tables if they do not exist; ReadOnly never writes.
    /// An open connection in another file or mode is closed and reopened.
    bool open(const QString &fileName, OpenMode mode = ReadOnly);
    void close();
    bool isOpen() const;

    QSqlDatabase database() const;
    QString lastError() const;

    bool createSchema();

    /// empty with lastError() set when the table cannot be read
    std::vector<Alignment> alignments() const;
    /// match by id first, then by name
    std::optional<Alignment> findAlignment(const QString &idOrName) const;
    /// id to run the command with: the matched alignment's id, otherwise
    /// `requested` unchanged (an empty request stays empty)
    std::string resolveAlignmentId(const QString &requested) const;

    // MaterialListSource
    std::optional<Alignment> alignment(const std::string& id) const override;
    std::vector<MaterialRecord> listMaterialLists() const override;
    std::vector<ItemRecord> listItems(const MaterialRecord& list) const override;
    std::vector<QuantityRecord> listQuantities(const ItemRecord& item) const override;

    // Read transaction held for the whole command; always rolled back
    class ReadScope {
    public:
        explicit ReadScope(DrawingDatabase &db);
        ~ReadScope();
        ReadScope(const ReadScope&) = delete;
        ReadScope& operator=(const ReadScope&) = delete;

        bool isActive() const { return m_active; }

    private:
        DrawingDatabase &m_db;
        bool m_active;
    };

private:
    QString m_connectionName;
    QSqlDatabase m_db;
    OpenMode m_mode = ReadOnly;
    mutable QString m_lastError;
};

#endif // DRAWINGDATABASE_H
