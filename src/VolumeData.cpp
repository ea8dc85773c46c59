#include "VolumeData.h"

const char* faultStageName(FaultStage stage) {
    switch (stage) {
        case FaultStage::Collection: return "collection";
        case FaultStage::Extraction: return "extraction";
    }
    return "unknown";
}
