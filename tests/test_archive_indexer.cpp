#include "crypto/digest.hpp"
#include "ova/archive_indexer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

namespace {

std::string Sha1Of(const std::string& s) {
    return ovaup::DigestHex(ovaup::DigestAlgorithm::Sha1,
                            std::span<const std::uint8_t>(
                                reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

class ArchiveIndexerTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Write(const std::vector<testutil::TarEntry>& entries,
                      const std::string& name = "vm.ova") {
        const std::string p = tmp.Path() + "/" + name;
        testutil::WriteFile(p, testutil::BuildTar(entries));
        return p;
    }

    // Bytes of the container at the entry's recorded position.
    static std::string At(const std::string& path, const ovaup::ArchiveEntry& e) {
        const std::string all = testutil::ReadFile(path);
        return all.substr(static_cast<size_t>(e.offset), static_cast<size_t>(e.size));
    }
};

TEST_F(ArchiveIndexerTests, IndexesDescriptorPayloadsAndManifest) {
    const std::string ovf = "<Envelope/>";
    const std::string disk1(3000, 'a');
    const std::string disk2 = "second disk contents";
    const std::string mf = "SHA1(vm.ovf)= " + Sha1Of(ovf) + "\n" +
                           "SHA1(vm-disk1.vmdk)= " + Sha1Of(disk1) + "\n" +
                           "SHA256(vm-disk2.vmdk)= " +
                           ovaup::DigestHex(ovaup::DigestAlgorithm::Sha256,
                                            std::span<const std::uint8_t>(
                                                reinterpret_cast<const std::uint8_t*>(disk2.data()),
                                                disk2.size())) +
                           "\n";

    const std::string path = Write({
        {"vm.ovf", ovf},
        {"vm.mf", mf},
        {"vm-disk1.vmdk", disk1},
        {"vm-disk2.vmdk", disk2},
    });

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(pkg.path, path);
    EXPECT_EQ(pkg.descriptor.name, "vm.ovf");
    EXPECT_EQ(At(path, pkg.descriptor), ovf);
    EXPECT_EQ(pkg.descriptor.checksum, Sha1Of(ovf));

    ASSERT_EQ(pkg.payloads.size(), 2u);
    EXPECT_EQ(pkg.payloads[0].name, "vm-disk1.vmdk");
    EXPECT_EQ(pkg.payloads[0].size, disk1.size());
    EXPECT_EQ(At(path, pkg.payloads[0]), disk1);
    EXPECT_EQ(pkg.payloads[0].checksum_algorithm, ovaup::DigestAlgorithm::Sha1);

    EXPECT_EQ(pkg.payloads[1].name, "vm-disk2.vmdk");
    EXPECT_EQ(At(path, pkg.payloads[1]), disk2);
    EXPECT_EQ(pkg.payloads[1].checksum_algorithm, ovaup::DigestAlgorithm::Sha256);

    ASSERT_TRUE(pkg.manifest.has_value());
    EXPECT_EQ(At(path, *pkg.manifest), mf);
    EXPECT_FALSE(pkg.signature.has_value());

    EXPECT_EQ(pkg.TotalPayloadSize(), disk1.size() + disk2.size());
    const auto names = pkg.ListEntries();
    EXPECT_EQ(names, (std::vector<std::string>{"vm.ovf", "vm-disk1.vmdk", "vm-disk2.vmdk", "vm.mf"}));

    EXPECT_TRUE(ovaup::ValidateChecksum(path, pkg.payloads[0]).ok);
    EXPECT_TRUE(ovaup::ValidateChecksum(path, pkg.payloads[1]).ok);
}

TEST_F(ArchiveIndexerTests, DataOffsetsAreRecordAligned) {
    const std::string path = Write({
        {"a.ovf", "x"},
        {"b.vmdk", std::string(1025, 'b')},
    });

    ovaup::ArchivePackage pkg;
    ASSERT_TRUE(ovaup::ArchiveIndexer{}.Index(path, pkg).ok);
    EXPECT_EQ(pkg.descriptor.offset % 512, 0u);
    ASSERT_EQ(pkg.payloads.size(), 1u);
    EXPECT_EQ(pkg.payloads[0].offset % 512, 0u);
    EXPECT_GT(pkg.payloads[0].offset, pkg.descriptor.offset);
}

TEST_F(ArchiveIndexerTests, NoManifestLeavesChecksumsEmpty) {
    const std::string path = Write({{"vm.ovf", "<x/>"}, {"d.vmdk", "data"}});

    ovaup::ArchivePackage pkg;
    ASSERT_TRUE(ovaup::ArchiveIndexer{}.Index(path, pkg).ok);
    EXPECT_FALSE(pkg.manifest.has_value());
    EXPECT_TRUE(pkg.payloads[0].checksum.empty());
    EXPECT_TRUE(ovaup::ValidateChecksum(path, pkg.payloads[0]).ok);
}

TEST_F(ArchiveIndexerTests, DirectoriesAndUnknownFilesAreSkipped) {
    const std::string path = Write({
        {"sub", "", AE_IFDIR},
        {"README.txt", "hello"},
        {"vm.ovf", "<x/>"},
        {"vm.cert", "cert"},
        {"d.VMDK", "data"},
    });

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_EQ(pkg.payloads.size(), 1u);
    EXPECT_EQ(pkg.payloads[0].name, "d.VMDK");
    ASSERT_TRUE(pkg.signature.has_value());
    EXPECT_EQ(pkg.signature->name, "vm.cert");
}

TEST_F(ArchiveIndexerTests, PayloadOffsetsIncreaseWithoutOverlap) {
    std::vector<testutil::TarEntry> entries{{"vm.ovf", "<x/>"}};
    for (int i = 0; i < 6; ++i)
        entries.push_back({"d" + std::to_string(i) + ".vmdk", std::string(100 + i * 777, 'a' + i)});
    const std::string path = Write(entries);

    ovaup::ArchivePackage pkg;
    ASSERT_TRUE(ovaup::ArchiveIndexer{}.Index(path, pkg).ok);
    ASSERT_EQ(pkg.payloads.size(), 6u);
    for (size_t i = 0; i + 1 < pkg.payloads.size(); ++i) {
        EXPECT_LT(pkg.payloads[i].offset, pkg.payloads[i + 1].offset);
        EXPECT_LE(pkg.payloads[i].offset + pkg.payloads[i].size, pkg.payloads[i + 1].offset);
    }
    for (const auto& p : pkg.payloads)
        EXPECT_EQ(At(path, p), std::string(p.size, p.name[1] - '0' + 'a'));
}

TEST_F(ArchiveIndexerTests, MissingDescriptorIsReported) {
    const std::string path = Write({{"d.vmdk", "data"}});

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::MissingRequiredEntry);
    EXPECT_NE(r.msg.find("OVF"), std::string::npos);
}

TEST_F(ArchiveIndexerTests, MissingPayloadIsReported) {
    const std::string path = Write({{"vm.ovf", "<x/>"}, {"vm.mf", ""}});

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::MissingRequiredEntry);
    EXPECT_NE(r.msg.find("VMDK"), std::string::npos);
}

TEST_F(ArchiveIndexerTests, SecondDescriptorIsRejected) {
    const std::string path = Write({{"a.ovf", "1"}, {"b.ovf", "2"}, {"d.vmdk", "d"}});

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::Parse);
}

TEST_F(ArchiveIndexerTests, DuplicateNamesAreRejected) {
    const std::string path = Write({{"vm.ovf", "1"}, {"d.vmdk", "a"}, {"d.vmdk", "b"}});

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::Parse);
    EXPECT_NE(r.msg.find("duplicate"), std::string::npos);
}

TEST_F(ArchiveIndexerTests, NonTarInputIsAParseError) {
    const std::string path = tmp.Path() + "/garbage.ova";
    std::string junk;
    while (junk.size() < 4096)
        junk += "this is definitely not a tar archive. ";
    testutil::WriteFile(path, junk);

    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(path, pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::Parse);
}

TEST_F(ArchiveIndexerTests, MissingContainerIsAnIoError) {
    ovaup::ArchivePackage pkg;
    auto r = ovaup::ArchiveIndexer{}.Index(tmp.Path() + "/nope.ova", pkg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::Io);
}

TEST_F(ArchiveIndexerTests, ChecksumMismatchIsDetected) {
    const std::string path = Write({
        {"vm.ovf", "<x/>"},
        {"vm.mf", "SHA1(d.vmdk)= 0000000000000000000000000000000000000000\n"},
        {"d.vmdk", "payload"},
    });

    ovaup::ArchivePackage pkg;
    ASSERT_TRUE(ovaup::ArchiveIndexer{}.Index(path, pkg).ok);
    auto r = ovaup::ValidateChecksum(path, pkg.payloads[0]);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ovaup::ErrorCode::ChecksumMismatch);
    EXPECT_NE(r.msg.find("d.vmdk"), std::string::npos);
}

TEST_F(ArchiveIndexerTests, ChecksumComparisonIgnoresCase) {
    const std::string path = Write({{"vm.ovf", "<x/>"}, {"d.vmdk", "payload"}});

    ovaup::ArchivePackage pkg;
    ASSERT_TRUE(ovaup::ArchiveIndexer{}.Index(path, pkg).ok);

    ovaup::ArchiveEntry e = pkg.payloads[0];
    e.checksum = Sha1Of("payload");
    for (auto& c : e.checksum)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(ovaup::ValidateChecksum(path, e).ok);
}

TEST(ClassifyEntryNameTests, UsesCaseInsensitiveExtension) {
    EXPECT_EQ(ovaup::ClassifyEntryName("a.ovf"), ovaup::EntryKind::Descriptor);
    EXPECT_EQ(ovaup::ClassifyEntryName("a.OVF"), ovaup::EntryKind::Descriptor);
    EXPECT_EQ(ovaup::ClassifyEntryName("dir/disk.vmdk"), ovaup::EntryKind::Payload);
    EXPECT_EQ(ovaup::ClassifyEntryName("a.mf"), ovaup::EntryKind::Manifest);
    EXPECT_EQ(ovaup::ClassifyEntryName("a.cert"), ovaup::EntryKind::Signature);
    EXPECT_EQ(ovaup::ClassifyEntryName("a.vmdk.bak"), ovaup::EntryKind::Other);
    EXPECT_EQ(ovaup::ClassifyEntryName("vmdk"), ovaup::EntryKind::Other);
}

} // namespace
