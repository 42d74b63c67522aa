#include "transcode/flac/VendorTag.hpp"
#include "transcode/FlacVendorClassifier.hpp"
#include "config/Config.hpp"
#include "TestStore.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace re::transcode;
using namespace re::test;

namespace {

void putBlockHeader(std::string& out, const bool last, const uint8_t type, const uint32_t length) {
    out.push_back(static_cast<char>((last ? 0x80 : 0x00) | type));
    out.push_back(static_cast<char>((length >> 16) & 0xff));
    out.push_back(static_cast<char>((length >> 8) & 0xff));
    out.push_back(static_cast<char>(length & 0xff));
}

void putLE32(std::string& out, const uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

// fLaC + STREAMINFO [+ PADDING] [+ VORBIS_COMMENT carrying vendor]
std::string flacBytes(const std::optional<std::string>& vendor, const bool withPadding = false) {
    std::string out = "fLaC";
    const bool streaminfoLast = !vendor && !withPadding;
    putBlockHeader(out, streaminfoLast, flac::BLOCK_STREAMINFO, 34);
    out.append(34, '\0');

    if (withPadding) {
        putBlockHeader(out, !vendor, 1, 16);
        out.append(16, '\0');
    }

    if (vendor) {
        std::string body;
        putLE32(body, static_cast<uint32_t>(vendor->size()));
        body += *vendor;
        putLE32(body, 0);  // no user comments
        putBlockHeader(out, true, flac::BLOCK_VORBIS_COMMENT, static_cast<uint32_t>(body.size()));
        out += body;
    }

    out.append(64, '\x55');  // stand-in for audio frames
    return out;
}

std::optional<std::string> vendorOf(const std::string& bytes) {
    std::istringstream in(bytes);
    return flac::readVendorString(in);
}

}

TEST(VendorTagTest, ReadsVendorString) {
    EXPECT_EQ(vendorOf(flacBytes("reference libFLAC 1.4.3 20230623")), "reference libFLAC 1.4.3 20230623");
}

TEST(VendorTagTest, SkipsPrecedingBlocks) {
    EXPECT_EQ(vendorOf(flacBytes("reference libFLAC 1.5.0 20250211", true)), "reference libFLAC 1.5.0 20250211");
}

TEST(VendorTagTest, EmptyVendorIsNotMissing) {
    const auto v = vendorOf(flacBytes(std::string()));
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->empty());
}

TEST(VendorTagTest, NoCommentBlockYieldsNullopt) {
    EXPECT_FALSE(vendorOf(flacBytes(std::nullopt)).has_value());
    EXPECT_FALSE(vendorOf(flacBytes(std::nullopt, true)).has_value());
}

TEST(VendorTagTest, RejectsNonFlac) {
    EXPECT_THROW(vendorOf("OggS"), std::runtime_error);
    EXPECT_THROW(vendorOf("fL"), std::runtime_error);
}

TEST(VendorTagTest, RejectsTruncatedMetadata) {
    const auto full = flacBytes("reference libFLAC 1.5.0 20250211");
    // cut inside the vendor string
    EXPECT_THROW(vendorOf(full.substr(0, 4 + 4 + 34 + 4 + 4 + 5)), std::runtime_error);
    // cut inside a block header
    EXPECT_THROW(vendorOf(full.substr(0, 6)), std::runtime_error);
}

TEST(VendorTagTest, RejectsVendorLongerThanBlock) {
    std::string out = "fLaC";
    putBlockHeader(out, true, flac::BLOCK_VORBIS_COMMENT, 8);
    putLE32(out, 500);
    out += "abcd";
    EXPECT_THROW(vendorOf(out), std::runtime_error);
}

TEST(VendorTagTest, ClassifierComparesAgainstTarget) {
    const auto dir = makeTempDir("vendor");
    const auto current = dir / "current.flac";
    const auto legacy = dir / "legacy.flac";
    const auto untagged = dir / "untagged.flac";
    writeFile(current, flacBytes(std::string(re::config::DEFAULT_TARGET_VENDOR)));
    writeFile(legacy, flacBytes("reference libFLAC 1.3.2 20170101"));
    writeFile(untagged, flacBytes(std::nullopt));

    const FlacVendorClassifier classifier(re::config::DEFAULT_TARGET_VENDOR);
    EXPECT_TRUE(classifier.conforms(current));
    EXPECT_FALSE(classifier.conforms(legacy));
    EXPECT_FALSE(classifier.conforms(untagged));
    EXPECT_THROW((void)classifier.conforms(dir / "absent.flac"), std::runtime_error);

    fs::remove_all(dir);
}
