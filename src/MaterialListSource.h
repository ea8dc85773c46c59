#pragma once
#include "VolumeData.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown by a source when the host cannot enumerate or read a record.
class SourceError : public std::runtime_error {
public:
    explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

// ─── MaterialListSource ───────────────────────────────────────────────────────
// Read-only view of the host drawing. Enumeration order is document order and
// must stay stable for the duration of one command. Every call may throw
// SourceError.
class MaterialListSource {
public:
    virtual ~MaterialListSource() = default;

    virtual std::optional<Alignment> alignment(const std::string& id) const = 0;

    // All material lists of the drawing, whatever alignment they belong to
    virtual std::vector<MaterialRecord> listMaterialLists() const = 0;

    virtual std::vector<ItemRecord> listItems(const MaterialRecord& list) const = 0;

    virtual std::vector<QuantityRecord> listQuantities(const ItemRecord& item) const = 0;
};
