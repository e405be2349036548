// ==============================================================================
// record.cpp - Модель данных записи трафика
// ==============================================================================

#include "mitigator/record.hpp"

namespace mitigator {

AnomalyLabel parse_anomaly_label(std::string_view s) {
    return s == ANOMALY_LABEL_VALUE ? AnomalyLabel::Anomaly : AnomalyLabel::Normal;
}

const char* to_string(AnomalyLabel label) {
    switch (label) {
    case AnomalyLabel::Anomaly:
        return "Anomaly";
    case AnomalyLabel::Normal:
        return "Normal";
    }
    return "Normal";
}

}  // namespace mitigator
