#pragma once
#include "MaterialListSource.h"
#include <string>
#include <vector>

// MaterialListCollector — material lists that belong to one alignment
class MaterialListCollector {
public:
    struct CollectResult {
        std::vector<MaterialRecord> lists;   // document order
        std::vector<RecordFault>    faults;
        bool success = false;                // false: the drawing could not be enumerated
    };

    // Never throws: a failed enumeration yields an empty result with one fault
    static CollectResult collect(const std::string& alignmentId,
                                 const MaterialListSource& source);
};
