#pragma once

#include <optional>
#include <string>

namespace ondd::ipc::lnb {

enum class LnbType {
    KuBand,     // North America Ku band
    CBand,
    Universal
};

constexpr int C_BAND_OFFSET = 5150;
constexpr int NA_KU_OFFSET = 10750;
constexpr int UNIVERSAL_LOW_OFFSET = 9750;
constexpr int UNIVERSAL_HIGH_OFFSET = 10600;
// Transponder frequency above which a universal LNB switches to the high band.
constexpr int UNIVERSAL_HIGH_SWITCH = 11700;

// Accepts the single-letter codes "k", "c" and "u".
std::optional<LnbType> parse_lnb_type(const std::string& code);

// Transponder frequency (MHz) to the L-band frequency the tuner is set to.
int to_l_band(int frequency, LnbType type);

// Whether the LNB needs the 22 kHz tone to select its high band.
bool needs_tone(int frequency, LnbType type);

// 13 V selects vertical polarization, 18 V horizontal; anything else is '0'.
char voltage_to_polarization(int voltage);

}
