/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/device_table.h"

#include <array>
#include <utility>

namespace kt::bundle {
namespace {
// Device codes as listed by KindleTool (abff364).
static const std::array<std::pair<std::uint16_t, std::string_view>, 184> kDevices = {{
    {0x01, "Kindle 1"},
    {0x02, "Kindle 2 US"},
    {0x03, "Kindle 2 International"},
    {0x04, "Kindle DX US"},
    {0x05, "Kindle DX International"},
    {0x07, "Unknown Kindle (0x07)"},
    {0x06, "Kindle 3 WiFi+3G"},
    {0x08, "Kindle 3 WiFi"},
    {0x09, "Kindle DX Graphite"},
    {0x0A, "Kindle 3 WiFi+3G Europe"},
    {0x0B, "Unknown Kindle (0x0B)"},
    {0x0C, "Unknown Kindle (0x0C)"},
    {0x0D, "Unknown Kindle (0x0D)"},
    {0x0E, "Silver Kindle 4 Non-Touch (2011)"},
    {0x0F, "Kindle 5 Touch WiFi+3G"},
    {0x10, "Kindle 5 Touch WiFi+3G Europe"},
    {0x11, "Kindle 5 Touch WiFi"},
    {0x12, "Kindle 5 Touch (Unknown Variant)"},
    {0x1B, "Kindle PaperWhite WiFi+3G"},
    {0x1C, "Kindle PaperWhite WiFi+3G Canada"},
    {0x1D, "Kindle PaperWhite WiFi+3G Europe"},
    {0x1F, "Kindle PaperWhite WiFi+3G Japan"},
    {0x20, "Kindle PaperWhite WiFi+3G Brazil"},
    {0x23, "Black Kindle 4 Non-Touch (2012)"},
    {0x24, "Kindle PaperWhite WiFi"},
    {0x5A, "Kindle PaperWhite 2 (2013) WiFi Japan"},
    {0xD4, "Kindle PaperWhite 2 (2013) WiFi"},
    {0xD5, "Kindle PaperWhite 2 (2013) WiFi+3G"},
    {0xD6, "Kindle PaperWhite 2 (2013) WiFi+3G Canada"},
    {0xD7, "Kindle PaperWhite 2 (2013) WiFi+3G Europe"},
    {0xD8, "Kindle PaperWhite 2 (2013) WiFi+3G Russia"},
    {0xF2, "Kindle PaperWhite 2 (2013) WiFi+3G Japan"},
    {0x17, "Kindle PaperWhite 2 (2013) WiFi (4GB) International"},
    {0x5F, "Kindle PaperWhite 2 (2013) WiFi+3G (4GB) Canada"},
    {0x60, "Kindle PaperWhite 2 (2013) WiFi+3G (4GB) Europe"},
    {0x61, "Kindle PaperWhite 2 (2013) WiFi+3G (4GB) Brazil"},
    {0x62, "Kindle PaperWhite 2 (2013) WiFi+3G (4GB)"},
    {0xF4, "Kindle PaperWhite 2 (2013) (Unknown Variant 0xF4)"},
    {0xF9, "Kindle PaperWhite 2 (2013) (Unknown Variant 0xF9)"},
    {0x13, "Kindle Voyage WiFi"},
    {0x54, "Kindle Voyage WiFi+3G"},
    {0x2A, "Kindle Voyage WiFi+3G Japan"},
    {0x4F, "Kindle Voyage WiFi+3G (Variant 0x4F)"},
    {0x52, "Kindle Voyage WiFi+3G Mexico"},
    {0x53, "Kindle Voyage WiFi+3G Europe"},
    {0xC6, "Kindle Basic (2014)"},
    {0x99, "Unknown Kindle (0x99)"},
    {0xDD, "Kindle Basic (2014) Australia"},
    {0x16, "Unknown Kindle (0x16)"},
    {0x21, "Unknown Kindle (0x21)"},
    {0x201, "Kindle PaperWhite 3 (2015) WiFi"},
    {0x202, "Kindle PaperWhite 3 (2015) WiFi+3G"},
    {0x204, "Kindle PaperWhite 3 (2015) WiFi+3G Mexico"},
    {0x205, "Kindle PaperWhite 3 (2015) WiFi+3G Europe"},
    {0x206, "Kindle PaperWhite 3 (2015) WiFi+3G Canada"},
    {0x207, "Kindle PaperWhite 3 (2015) WiFi+3G Japan"},
    {0x26B, "White Kindle PaperWhite 3 (2016) WiFi"},
    {0x26C, "White Kindle PaperWhite 3 (2016) WiFi+3G Japan"},
    {0x26D, "White Kindle PaperWhite 3 (Unknown Variant 0KD)"},
    {0x26E, "White Kindle PaperWhite 3 (2016) WiFi+3G International"},
    {0x26F, "White Kindle PaperWhite 3 (2016) WiFi+3G International (Bis)"},
    {0x270, "White Kindle PaperWhite 3 (Unknown Variant 0KG)"},
    {0x293, "Kindle PaperWhite 3 (2016) WiFi (32GB) Japan"},
    {0x294, "White Kindle PaperWhite 3 (2016) WiFi (32GB) Japan"},
    {0x6F7B, "Kindle PaperWhite 3 (2016) (Unknown Variant TTT)"},
    {0x20C, "Kindle Oasis WiFi"},
    {0x20D, "Kindle Oasis WiFi+3G"},
    {0x219, "Kindle Oasis WiFi+3G International"},
    {0x21A, "Kindle Oasis (Unknown Variant 0GS)"},
    {0x21B, "Kindle Oasis WiFi+3G China"},
    {0x21C, "Kindle Oasis WiFi+3G Europe"},
    {0x1BC, "Kindle Basic 2 (2016) (Unknown Variant 0DU)"},
    {0x269, "Kindle Basic 2 (2016)"},
    {0x26A, "White Kindle Basic 2 (2016)"},
    {0x295, "Kindle Oasis 2 (2017) (Unknown Variant 0LM)"},
    {0x296, "Kindle Oasis 2 (2017) (Unknown Variant 0LN)"},
    {0x297, "Kindle Oasis 2 (2017) (Unknown Variant 0LP)"},
    {0x298, "Kindle Oasis 2 (2017) (Unknown Variant 0LQ)"},
    {0x2E1, "Champagne Kindle Oasis 2 (2017) WiFi (32GB)"},
    {0x2E2, "Kindle Oasis 2 (2017) (Unknown Variant 0P2)"},
    {0x2E6, "Kindle Oasis 2 (2017) WiFi+3G (32GB) (Variant 0P6)"},
    {0x2E7, "Kindle Oasis 2 (2017) (Unknown Variant 0P7)"},
    {0x2E8, "Kindle Oasis 2 (2017) WiFi (8GB)"},
    {0x341, "Kindle Oasis 2 (2017) WiFi+3G (32GB)"},
    {0x342, "Kindle Oasis 2 (2017) WiFi+3G (32GB) Europe"},
    {0x343, "Kindle Oasis 2 (2017) (Unknown Variant 0S3)"},
    {0x344, "Kindle Oasis 2 (2017) (Unknown Variant 0S4)"},
    {0x347, "Kindle Oasis 2 (2017) (Unknown Variant 0S7)"},
    {0x34A, "Kindle Oasis 2 (2017) WiFi (32GB)"},
    {0x2F7, "Kindle PaperWhite 4 (2018) WiFi (8GB)"},
    {0x361, "Kindle PaperWhite 4 (2018) WiFi+4G (32GB)"},
    {0x362, "Kindle PaperWhite 4 (2018) WiFi+4G (32GB) Europe"},
    {0x363, "Kindle PaperWhite 4 (2018) WiFi+4G (32GB) Japan"},
    {0x364, "Kindle PaperWhite 4 (2018) (Unknown Variant 0T4)"},
    {0x365, "Kindle PaperWhite 4 (2018) (Unknown Variant 0T5)"},
    {0x366, "Kindle PaperWhite 4 (2018) WiFi (32GB)"},
    {0x367, "Kindle PaperWhite 4 (2018) (Unknown Variant 0T7)"},
    {0x372, "Kindle PaperWhite 4 (2018) (Unknown Variant 0TJ)"},
    {0x373, "Kindle PaperWhite 4 (2018) (Unknown Variant 0TK)"},
    {0x374, "Kindle PaperWhite 4 (2018) (Unknown Variant 0TL)"},
    {0x375, "Kindle PaperWhite 4 (2018) (Unknown Variant 0TM)"},
    {0x376, "Kindle PaperWhite 4 (2018) (Unknown Variant 0TN)"},
    {0x402, "Kindle PaperWhite 4 (2018) WiFi (8GB) India"},
    {0x403, "Kindle PaperWhite 4 (2018) WiFi (32GB) India"},
    {0x4D8, "Twilight Blue Kindle PaperWhite 4 (2018) WiFi (32GB)"},
    {0x4D9, "Plum Kindle PaperWhite 4 (2018) WiFi (32GB)"},
    {0x4DA, "Sage Kindle PaperWhite 4 (2018) WiFi (32GB)"},
    {0x4DB, "Twilight Blue Kindle PaperWhite 4 (2018) WiFi (8GB)"},
    {0x4DC, "Plum Kindle PaperWhite 4 (2018) WiFi (8GB)"},
    {0x4DD, "Sage Kindle PaperWhite 4 (2018) WiFi (8GB)"},
    {0x2F4, "Kindle PaperWhite 4 (2018) (Unknown Variant 0PL)"},
    {0x414, "Kindle Basic 3 (2019)"},
    {0x3CF, "White Kindle Basic 3 (2019) (8GB)"},
    {0x3D0, "Kindle Basic 3 (2019) (Unknown Variant 0WG)"},
    {0x3D1, "White Kindle Basic 3 (2019)"},
    {0x3D2, "Kindle Basic 3 (2019) (Unknown Variant 0WJ)"},
    {0x3AB, "Kindle Basic 3 (2019) Kids Edition"},
    {0x434, "Champagne Kindle Oasis 3 (2019) WiFi (32GB)"},
    {0x3D8, "Kindle Oasis 3 (2019) WiFi+4G (32GB) Japan"},
    {0x3D7, "Kindle Oasis 3 (2019) WiFi+4G (32GB) India"},
    {0x3D6, "Kindle Oasis 3 (2019) WiFi+4G (32GB)"},
    {0x3D5, "Kindle Oasis 3 (2019) WiFi (32GB)"},
    {0x3D4, "Kindle Oasis 3 (2019) WiFi (8GB)"},
    {0x690, "Kindle PaperWhite 5 Signature Edition (2021)"},
    {0x700, "Kindle PaperWhite 5 (2011) (Unknown Variant 1Q0)"},
    {0x6FF, "Kindle PaperWhite 5 (2021)"},
    {0x7AD, "Kindle PaperWhite 5 (2021) (Unknown Variant 1VD)"},
    {0x829, "Kindle PaperWhite 5 Signature Edition (2021) (Variant 219)"},
    {0x82A, "Kindle PaperWhite 5 (2021) (Variant 21A)"},
    {0x971, "Kindle PaperWhite 5 Signature Edition (2021) (Variant 2BH)"},
    {0x972, "Kindle PaperWhite 5 (2021) (Unknown Variant 2BJ)"},
    {0x9B3, "Kindle PaperWhite 5 (2021) (Variant 2DK)"},
    {0x84D, "Kindle Basic 4 (2022) (Unknown Variant 22D)"},
    {0x8BB, "Kindle Basic 4 (2022) (Unknown Variant 25T)"},
    {0x86A, "Kindle Basic 4 (2022) (Unknown Variant 23A)"},
    {0x958, "Kindle Basic 4 (2022) (Variant 2AQ)"},
    {0x957, "Kindle Basic 4 (2022) (Variant 2AP)"},
    {0x7F1, "Kindle Basic 4 (2022) (Unknown Variant 1XH)"},
    {0x84C, "Kindle Basic 4 (2022) (Unknown Variant 22C)"},
    {0x8F2, "Kindle Scribe (Unknown Variant 27J)"},
    {0x974, "Kindle Scribe (Unknown Variant 2BL)"},
    {0x8C3, "Kindle Scribe (Unknown Variant 263)"},
    {0x847, "Kindle Scribe (16GB) (Variant 227)"},
    {0x975, "Kindle Scribe (Unknown Variant 2BM)"},
    {0x874, "Kindle Scribe (Variant 23L)"},
    {0x875, "Kindle Scribe (64GB) (Variant 23M)"},
    {0x8E0, "Kindle Scribe (Unknown Variant 270)"},
    {0xE85, "Kindle Basic 5 (2024) (Unknown Variant 3L5)"},
    {0xE86, "Kindle Basic 5 (2024) (Unknown Variant 3L6)"},
    {0xE84, "Kindle Basic 5 (2024) (Unknown Variant 3L4)"},
    {0xE83, "Kindle Basic 5 (2024) (Unknown Variant 3L3)"},
    {0x2909, "Kindle Basic 5 (2024) (Unknown Variant A89)"},
    {0xE82, "Kindle Basic 5 (2024) (Unknown Variant 3L2)"},
    {0xE75, "Kindle Basic 5 (2024) (Unknown Variant 3KM)"},
    {0xC89, "Kindle PaperWhite 6 (2024) (Unknown Variant 349)"},
    {0xC86, "Kindle PaperWhite 6 (2024) (Unknown Variant 346)"},
    {0xC7F, "Kindle PaperWhite 6 (2024) (Unknown Variant 33X)"},
    {0xC7E, "Kindle PaperWhite 6 (2024) (Unknown Variant 33W)"},
    {0xE2A, "Kindle PaperWhite 6 (2024) (Unknown Variant 3HA)"},
    {0xE25, "Kindle PaperWhite 6 (2024) (Unknown Variant 3H5)"},
    {0xE23, "Kindle PaperWhite 6 (2024) (Unknown Variant 3H3)"},
    {0xE28, "Kindle PaperWhite 6 (2024) (Unknown Variant 3H8)"},
    {0xE45, "Kindle PaperWhite 6 (2024) (Unknown Variant 3J5)"},
    {0xE5A, "Kindle PaperWhite 6 (2024) (Unknown Variant 3JS)"},
    {0xFA0, "Kindle Scribe 2 (2024) (Unknown Variant 3V0)"},
    {0xFA1, "Kindle Scribe 2 (2024) (Unknown Variant 3V1)"},
    {0xFE5, "Kindle Scribe 2 (2024) (Unknown Variant 3X5)"},
    {0xF9D, "Kindle Scribe 2 (2024) (Unknown Variant 3UV)"},
    {0xFE4, "Kindle Scribe 2 (2024) (Unknown Variant 3X4)"},
    {0xFE3, "Kindle Scribe 2 (2024) (Unknown Variant 3X3)"},
    {0x102E, "Kindle Scribe 2 (2024) (Unknown Variant 41E)"},
    {0x102D, "Kindle Scribe 2 (2024) (Unknown Variant 41D)"},
    {0xE29, "Kindle ColorSoft (2024) (Unknown Variant 3H9)"},
    {0xE24, "Kindle ColorSoft (2024) (Unknown Variant 3H4)"},
    {0xE2B, "Kindle ColorSoft (2024) (Unknown Variant 3HB)"},
    {0xE26, "Kindle ColorSoft (2024) (Unknown Variant 3H6)"},
    {0xE22, "Kindle ColorSoft (2024) (Unknown Variant 3H2)"},
    {0xC9F, "Kindle ColorSoft (2024) (Unknown Variant 34X)"},
    {0xE27, "Kindle ColorSoft (2024) (Unknown Variant 3H7)"},
    {0xE5B, "Kindle ColorSoft (2024) (Unknown Variant 3JT)"},
    {0xE46, "Kindle ColorSoft (2024) (Unknown Variant 3J6)"},
    {0x10A6, "Kindle ColorSoft (2024) (Unknown Variant 456)"},
    {0x10A5, "Kindle ColorSoft (2024) (Unknown Variant 455)"},
    {0x11D7, "Kindle ColorSoft (2024) (Unknown Variant 4EP)"},
}};

static const std::array<std::pair<std::uint32_t, std::string_view>, 15> kPlatforms = {{
    {0x00, "Unspecified"},
    {0x01, "Mario (Deprecated)"},
    {0x02, "Luigi"},
    {0x03, "Banjo"},
    {0x04, "Yoshi"},
    {0x05, "Yoshime (Prototype)"},
    {0x06, "Yoshime (Yoshime3)"},
    {0x07, "Wario"},
    {0x08, "Duet"},
    {0x09, "Heisenberg"},
    {0x0A, "Zelda"},
    {0x0B, "Rex"},
    {0x0C, "Bellatrix"},
    {0x0D, "Bellatrix3"},
    {0x0E, "Bellatrix4"},
}};

static const std::array<std::pair<std::uint32_t, std::string_view>, 3> kCertFiles = {{
    {0x00, "pubdevkey01.pem (Developer)"},
    {0x01, "pubprodkey01.pem (Official 1K)"},
    {0x02, "pubprodkey02.pem (Official 2K)"},
}};

template <typename Code, std::size_t N>
std::string_view
find_name(const std::array<std::pair<Code, std::string_view>, N>& table, Code code) {
    for (const auto& [k, v] : table) {
        if (k == code) {
            return v;
        }
    }
    return kUnknownName;
}
}  // namespace

std::string_view device_name(std::uint16_t code) { return find_name(kDevices, code); }

std::string_view platform_name(std::uint32_t code) { return find_name(kPlatforms, code); }

std::string_view cert_file_name(std::uint32_t cert_num) { return find_name(kCertFiles, cert_num); }
}  // namespace kt::bundle
