#include "VolumeAggregator.h"
#include <QDebug>
#include <QString>

VolumeAggregator::AggregateResult VolumeAggregator::aggregate(
    const std::vector<MaterialRecord>& lists,
    const MaterialListSource& source) const
{
    AggregateResult res;
    double cumulativeCut  = 0.0;
    double cumulativeFill = 0.0;

    for (const auto& list : lists) {
        std::vector<ItemRecord> items;
        try {
            items = source.listItems(list);
        } catch (const SourceError& e) {
            res.faults.push_back({list.id, FaultStage::Collection, e.what()});
            continue;
        }
        if (verboseLogging)
            qDebug() << "material list" << QString::fromStdString(list.name)
                     << "items:" << int(items.size());

        for (const auto& item : items) {
            // read the whole item first: a failure must not leave half of it
            std::vector<QuantityRecord> quantities;
            try {
                quantities = source.listQuantities(item);
            } catch (const SourceError& e) {
                res.faults.push_back({item.id, FaultStage::Extraction, e.what()});
                continue;
            }
            if (verboseLogging)
                qDebug() << "  item" << QString::fromStdString(item.name)
                         << "quantities:" << int(quantities.size());

            for (const auto& q : quantities) {
                cumulativeCut  += q.cutVolume;
                cumulativeFill += q.fillVolume;

                VolumeRow row;
                row.materialListName = list.name;
                row.materialName     = item.name;
                row.stationStart     = q.stationStart;
                row.stationEnd       = q.stationEnd;
                row.cutVolume        = q.cutVolume;
                row.fillVolume       = q.fillVolume;
                row.netVolume        = q.cutVolume - q.fillVolume;
                row.cumulativeCut    = cumulativeCut;
                row.cumulativeFill   = cumulativeFill;
                res.table.rows.push_back(std::move(row));
            }
        }
    }

    res.table.totalCut  = cumulativeCut;
    res.table.totalFill = cumulativeFill;
    return res;
}
