#include "folio/core/types.h"

namespace folio {

const char* folioErrorName(FolioError error) noexcept {
    switch (error) {
        case FolioError::Ok: return "Ok";
        case FolioError::InvalidJson: return "InvalidJson";
        case FolioError::InvalidOperation: return "InvalidOperation";
        case FolioError::BlockLimitReached: return "BlockLimitReached";
        case FolioError::UnknownBlock: return "UnknownBlock";
        case FolioError::GestureActive: return "GestureActive";
        case FolioError::NoGesture: return "NoGesture";
    }
    return "Unknown";
}

} // namespace folio
