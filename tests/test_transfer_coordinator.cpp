#include "crypto/digest.hpp"
#include "session/session_tracker.hpp"
#include "testing.hpp"
#include "transfer/transfer_coordinator.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

namespace {

using namespace ovaup;
using namespace std::chrono_literals;

constexpr std::uint64_t kMiB = 1024 * 1024;

class RecordingProgress final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override {
        std::lock_guard<std::mutex> lk(mu);
        last_item_done = e.item_done;
        last_overall_done = e.overall_done;
        last_overall_total = e.overall_total;
        ++events;
    }

    std::mutex mu;
    int events = 0;
    std::uint64_t last_item_done = 0;
    std::uint64_t last_overall_done = 0;
    std::uint64_t last_overall_total = 0;
};

class TransferCoordinatorTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    testutil::FakeHttpClient http;
    testutil::FakeHypervisorClient hv;
    CancelToken cancel;

    CoordinatorOptions Options(std::uint64_t chunk, int workers) {
        CoordinatorOptions o;
        o.upload.chunk_size = chunk;
        o.upload.workers = workers;
        o.retry.base_delay = 1ms;
        o.retry.max_delay = 2ms;
        o.retry.jitter_fraction = 0.0;
        o.datastore = "datastore1";
        o.vm_name = "web01";
        o.network = "VM Network";
        return o;
    }

    std::unique_ptr<SessionTracker> MakeTracker(std::uint64_t chunk) {
        TrackerOptions o;
        o.session_dir = tmp.Path();
        o.chunk_size = chunk;
        o.auto_save = false;
        return SessionTracker::Create({"5", "web01.ova", "esxi.test", "datastore1", "web01"}, o);
    }

    // "<desc><disk>" laid out back to back in one in-memory container.
    static ArchivePackage SmallPackage(testutil::MemoryRangeSource& source,
                                       const std::string& desc,
                                       const std::string& disk,
                                       const std::string& disk_checksum = "") {
        source.Add("web01.ova", desc + disk);

        ArchivePackage pkg;
        pkg.path = "web01.ova";
        pkg.file_size = desc.size() + disk.size();
        pkg.descriptor = {"web01.ovf", desc.size(), 0, "", std::nullopt};
        ArchiveEntry payload;
        payload.name = "web01-disk1.vmdk";
        payload.size = disk.size();
        payload.offset = desc.size();
        payload.checksum = disk_checksum;
        pkg.payloads.push_back(payload);
        return pkg;
    }
};

TEST_F(TransferCoordinatorTests, RetriesTransientFailureAndCompletes) {
    constexpr std::uint64_t kDesc = 512;
    constexpr std::uint64_t kDisk = 100 * kMiB;
    testutil::PatternRangeSource source(kDesc + kDisk);

    ArchivePackage pkg;
    pkg.path = "web01.ova";
    pkg.descriptor = {"web01.ovf", kDesc, 0, "", std::nullopt};
    pkg.payloads.push_back({"web01-disk1.vmdk", kDisk, kDesc, "", std::nullopt});

    http.Script({201, "", ""});
    http.Script({0, "", "unexpected EOF: Failure when receiving data from the peer"});

    RecordingProgress progress;
    auto tracker = MakeTracker(32 * kMiB);
    TransferCoordinator coord(hv, http, source, Options(32 * kMiB, 1), &progress);

    auto r = coord.Run(pkg, *tracker, cancel);
    ASSERT_TRUE(r.ok) << r.msg;

    const UploadSession s = tracker->SnapshotSession();
    const ItemProgress& item = s.files.at("web01-disk1.vmdk");
    EXPECT_EQ(item.uploaded_size, kDisk);
    EXPECT_EQ(item.chunks_total, 4u);
    EXPECT_EQ(item.chunks_uploaded, 4u);
    EXPECT_TRUE(item.is_completed);
    EXPECT_TRUE(s.is_completed);
    EXPECT_EQ(s.retry_attempts, 1u);

    // Chunk 1 is sent once, chunk 2 twice, chunks 3 and 4 once.
    const auto puts = http.Puts();
    ASSERT_EQ(puts.size(), 5u);
    EXPECT_EQ(puts[1].byte_sum, puts[2].byte_sum);
    std::uint64_t acked = 0;
    for (size_t i = 0; i < puts.size(); ++i) {
        if (i != 1)
            acked += puts[i].bytes_read;
    }
    EXPECT_EQ(acked, kDisk);
    EXPECT_EQ(puts[4].content_length, 4 * kMiB);
    EXPECT_EQ(puts[0].url, "https://esxi.test/folder/web01/web01-disk1.vmdk?dsName=datastore1");
    EXPECT_EQ(puts[0].username, "root");
    EXPECT_EQ(puts[0].password, "secret");

    EXPECT_EQ(hv.connects, 1);
    EXPECT_EQ(hv.creates, 1);
    EXPECT_EQ(hv.disconnects, 1);
    EXPECT_EQ(hv.created_name, "web01");
    EXPECT_EQ(hv.created_network, "VM Network");
    EXPECT_EQ(hv.created_descriptor.size(), kDesc);

    EXPECT_FALSE(testutil::FileExists(tracker->SessionFile()));

    EXPECT_GT(progress.events, 0);
    EXPECT_EQ(progress.last_overall_done, kDisk);
    EXPECT_EQ(progress.last_overall_total, kDisk);
}

TEST_F(TransferCoordinatorTests, ParallelUploadMatchesSequentialBytes) {
    testutil::MemoryRangeSource source;
    std::string disk;
    for (int i = 0; i < 10000; ++i)
        disk.push_back(static_cast<char>('a' + i % 26));
    auto pkg = SmallPackage(source, "<Envelope/>", disk);

    http.keep_bodies = true;
    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 4));
    ASSERT_TRUE(coord.Run(pkg, *tracker, cancel).ok);

    std::uint64_t total = 0;
    for (const auto& p : http.Puts())
        total += p.body.size();
    EXPECT_EQ(total, disk.size());
    EXPECT_EQ(http.Puts().size(), 10u);
    EXPECT_EQ(hv.created_descriptor, "<Envelope/>");
}

TEST_F(TransferCoordinatorTests, ResumedCompletedPayloadIsNotResent) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", std::string(3000, 'x'));

    std::string path;
    {
        auto first = MakeTracker(1024);
        first->RegisterItem("web01-disk1.vmdk", 3000, "");
        first->MarkItemComplete("web01-disk1.vmdk");
        path = first->SessionFile();
    }
    ASSERT_TRUE(testutil::FileExists(path));

    TrackerOptions topt;
    topt.session_dir = tmp.Path();
    topt.chunk_size = 1024;
    topt.auto_save = false;
    std::unique_ptr<SessionTracker> tracker;
    ASSERT_TRUE(SessionTracker::Load(path, topt, tracker).ok);
    ASSERT_TRUE(tracker->IsItemComplete("web01-disk1.vmdk"));

    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    auto r = coord.Run(pkg, *tracker, cancel);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_TRUE(http.Puts().empty());
    EXPECT_EQ(hv.creates, 1);
    EXPECT_FALSE(testutil::FileExists(tracker->SessionFile()));
}

TEST_F(TransferCoordinatorTests, ChecksumMismatchStopsBeforeConnecting) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data",
                            "0000000000000000000000000000000000000000");

    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    auto r = coord.Run(pkg, *tracker, cancel);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(hv.connects, 0);
    EXPECT_TRUE(http.Puts().empty());
}

TEST_F(TransferCoordinatorTests, MatchingChecksumPasses) {
    testutil::MemoryRangeSource source;
    const std::string disk = "disk data";
    const std::string sha1 = DigestHex(
        DigestAlgorithm::Sha1,
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(disk.data()), disk.size()));
    auto pkg = SmallPackage(source, "<Envelope/>", disk, sha1);

    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    ASSERT_TRUE(coord.Run(pkg, *tracker, cancel).ok);
    EXPECT_EQ(http.Puts().size(), 1u);
}

TEST_F(TransferCoordinatorTests, ChecksumCheckCanBeDisabled) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data",
                            "0000000000000000000000000000000000000000");

    auto opt = Options(1024, 1);
    opt.verify_checksums = false;
    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, opt);
    EXPECT_TRUE(coord.Run(pkg, *tracker, cancel).ok);
}

TEST_F(TransferCoordinatorTests, CreateFailureKeepsSession) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data");
    hv.create_result = Result::Fail(ErrorCode::Network, "upload failed with status 500: no");

    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    auto r = coord.Run(pkg, *tracker, cancel);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.msg.rfind("failed to create web01", 0), 0u);
    EXPECT_TRUE(testutil::FileExists(tracker->SessionFile()));
    EXPECT_TRUE(tracker->IsItemComplete("web01-disk1.vmdk"));
    EXPECT_EQ(hv.disconnects, 1);
}

TEST_F(TransferCoordinatorTests, NonRetryableStatusFailsAfterOneAttempt) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data");
    http.Script({500, "boom", ""});

    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    auto r = coord.Run(pkg, *tracker, cancel);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::Exhausted);
    EXPECT_EQ(r.msg.rfind("failed to upload web01-disk1.vmdk", 0), 0u);
    EXPECT_NE(r.msg.find("status 500"), std::string::npos);
    EXPECT_EQ(http.Puts().size(), 1u);
    EXPECT_EQ(tracker->SnapshotSession().retry_attempts, 0u);
    EXPECT_EQ(hv.creates, 0);
    EXPECT_TRUE(testutil::FileExists(tracker->SessionFile()));
}

TEST_F(TransferCoordinatorTests, BoundedRetriesAreExhausted) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data");
    for (int i = 0; i < 3; ++i)
        http.Script({503, "", ""});

    auto opt = Options(1024, 1);
    opt.retry.max_attempts = 3;
    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, opt);
    auto r = coord.Run(pkg, *tracker, cancel);
    EXPECT_EQ(r.code, ErrorCode::Exhausted);
    EXPECT_EQ(http.Puts().size(), 3u);
    EXPECT_EQ(tracker->SnapshotSession().retry_attempts, 2u);
}

TEST_F(TransferCoordinatorTests, LookupFailureDisconnects) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data");
    hv.lookup_result = Result::Fail(ErrorCode::NotFound, "datastore datastore1 not found");

    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    auto r = coord.Run(pkg, *tracker, cancel);
    EXPECT_EQ(r.code, ErrorCode::NotFound);
    EXPECT_EQ(hv.disconnects, 1);
    EXPECT_TRUE(http.Puts().empty());
}

TEST_F(TransferCoordinatorTests, CancelledRunKeepsSession) {
    testutil::MemoryRangeSource source;
    auto pkg = SmallPackage(source, "<Envelope/>", "disk data");
    cancel.Cancel();

    auto opt = Options(1024, 1);
    opt.verify_checksums = false;
    auto tracker = MakeTracker(1024);
    TransferCoordinator coord(hv, http, source, opt);
    auto r = coord.Run(pkg, *tracker, cancel);
    EXPECT_EQ(r.code, ErrorCode::Cancelled);
    EXPECT_TRUE(http.Puts().empty());
    EXPECT_TRUE(testutil::FileExists(tracker->SessionFile()));
}

TEST_F(TransferCoordinatorTests, RemotePathUsesBaseName) {
    testutil::MemoryRangeSource source;
    TransferCoordinator coord(hv, http, source, Options(1024, 1));
    ArchiveEntry e;
    e.name = "sub/dir/disk.vmdk";
    EXPECT_EQ(coord.RemotePathFor(e), "web01/disk.vmdk");
}

} // namespace
