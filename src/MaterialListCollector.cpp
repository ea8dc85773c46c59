#include "MaterialListCollector.h"

MaterialListCollector::CollectResult MaterialListCollector::collect(
    const std::string& alignmentId, const MaterialListSource& source)
{
    CollectResult res;

    std::vector<MaterialRecord> all;
    try {
        all = source.listMaterialLists();
    } catch (const SourceError& e) {
        res.faults.push_back({alignmentId, FaultStage::Collection, e.what()});
        return res;
    }

    for (auto& rec : all) {
        if (rec.alignmentId == alignmentId)
            res.lists.push_back(std::move(rec));
    }
    res.success = true;
    return res;
}
