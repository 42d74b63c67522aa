#include "transcode/flac/VendorTag.hpp"

#include <array>
#include <fstream>
#include <stdexcept>

namespace re::transcode::flac {

namespace {

constexpr std::array<char, 4> MAGIC{'f', 'L', 'a', 'C'};

// Vendor strings are short; anything larger means a corrupt block.
constexpr uint32_t MAX_VENDOR_LENGTH = 1u << 20;

void readExact(std::istream& in, char* buf, const std::streamsize n, const char* what) {
    if (!in.read(buf, n) || in.gcount() != n)
        throw std::runtime_error(std::string("Truncated FLAC stream while reading ") + what);
}

}

std::optional<std::string> readVendorString(std::istream& in) {
    std::array<char, 4> magic{};
    readExact(in, magic.data(), magic.size(), "stream marker");
    if (magic != MAGIC) throw std::runtime_error("Not a FLAC stream: missing fLaC marker");

    while (true) {
        std::array<unsigned char, 4> header{};
        readExact(in, reinterpret_cast<char*>(header.data()), header.size(), "metadata block header");

        const bool last = (header[0] & 0x80) != 0;
        const uint8_t type = header[0] & 0x7f;
        const uint32_t length = (static_cast<uint32_t>(header[1]) << 16) |
                                (static_cast<uint32_t>(header[2]) << 8) |
                                 static_cast<uint32_t>(header[3]);

        if (type == 127) throw std::runtime_error("Invalid FLAC metadata block type 127");

        if (type == BLOCK_VORBIS_COMMENT) {
            if (length < 4) throw std::runtime_error("VORBIS_COMMENT block too short");

            std::array<unsigned char, 4> len{};
            readExact(in, reinterpret_cast<char*>(len.data()), len.size(), "vendor length");
            const uint32_t vendorLength = static_cast<uint32_t>(len[0]) |
                                          (static_cast<uint32_t>(len[1]) << 8) |
                                          (static_cast<uint32_t>(len[2]) << 16) |
                                          (static_cast<uint32_t>(len[3]) << 24);

            if (vendorLength > length - 4 || vendorLength > MAX_VENDOR_LENGTH)
                throw std::runtime_error("Vendor string overruns its VORBIS_COMMENT block");

            std::string vendor(vendorLength, '\0');
            readExact(in, vendor.data(), vendorLength, "vendor string");
            return vendor;
        }

        if (last) return std::nullopt;

        in.seekg(length, std::ios::cur);
        if (!in) throw std::runtime_error("Truncated FLAC stream while skipping metadata block");
    }
}

std::optional<std::string> readVendorString(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + file.string());
    return readVendorString(in);
}

}
