#include "ondd/ipc/lnb.hpp"
#include "ondd/core/utils.hpp"
#include <cstdlib>

namespace ondd::ipc::lnb {

std::optional<LnbType> parse_lnb_type(const std::string& code) {
    auto lower = core::utils::StringUtils::to_lower(code);

    if (lower == "k") return LnbType::KuBand;
    if (lower == "c") return LnbType::CBand;
    if (lower == "u") return LnbType::Universal;
    return std::nullopt;
}

int to_l_band(int frequency, LnbType type) {
    switch (type) {
        case LnbType::KuBand:
            return frequency - NA_KU_OFFSET;
        case LnbType::CBand:
            return std::abs(frequency - C_BAND_OFFSET);
        case LnbType::Universal:
            break;
    }

    if (frequency > UNIVERSAL_HIGH_SWITCH) {
        return frequency - UNIVERSAL_HIGH_OFFSET;
    }
    return frequency - UNIVERSAL_LOW_OFFSET;
}

bool needs_tone(int frequency, LnbType type) {
    if (type == LnbType::KuBand || type == LnbType::CBand) {
        return false;
    }
    return frequency > UNIVERSAL_HIGH_SWITCH;
}

char voltage_to_polarization(int voltage) {
    switch (voltage) {
        case 13: return 'v';
        case 18: return 'h';
        default: return '0';
    }
}

}
