#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pmem_decoder/error.hpp"
#include "pmem_decoder/memory_image.hpp"

#include <cstdio>
#include <map>

using namespace pmem_decoder;
using namespace testing;

namespace {

// Fills every block with its index and counts the fetches
class CountingSource : public IBlockSource {
public:
    bool fetchBlock(size_t blockIndex, Bytes& out, std::string&) override {
        ++fetches[blockIndex];
        out.assign(BLOCK_SIZE, static_cast<uint8_t>(blockIndex & 0xFF));
        return true;
    }

    size_t total() const {
        size_t count = 0;
        for (const auto& item : fetches) {
            count += item.second;
        }
        return count;
    }

    std::map<size_t, size_t> fetches;
};

class MockBlockSource : public IBlockSource {
public:
    MOCK_METHOD(bool, fetchBlock, (size_t blockIndex, Bytes& out, std::string& error), (override));
};

} // namespace

class MemoryImageTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<CountingSource>();
        image = std::make_unique<MemoryImage>(source, 8 * BLOCK_SIZE);
    }

    std::shared_ptr<CountingSource> source;
    std::unique_ptr<MemoryImage> image;
};

TEST_F(MemoryImageTest, FetchesOnlyCoveringBlocks) {
    Bytes data = image->read(100, 10);
    EXPECT_EQ(10u, data.size());
    EXPECT_EQ(1u, source->total());
    EXPECT_TRUE(image->haveData(0, BLOCK_SIZE));
    EXPECT_FALSE(image->haveData(BLOCK_SIZE, 1));

    // Overlaps block 0, which is already present
    data = image->read(500, 600);
    EXPECT_EQ(3u, source->total());
    EXPECT_EQ(1u, source->fetches[0]);
    EXPECT_EQ(1u, source->fetches[1]);
    EXPECT_EQ(1u, source->fetches[2]);
    EXPECT_EQ(0, data[0]);
    EXPECT_EQ(1, data[100]);
    EXPECT_EQ(2, data[599]);
}

TEST_F(MemoryImageTest, RepeatedReadFetchesNothing) {
    image->read(700, 1500);
    const uint64_t fetched = image->fetchCount();
    EXPECT_EQ(source->total(), fetched);

    image->read(700, 1500);
    image->read(1024, 10);
    EXPECT_EQ(fetched, image->fetchCount());
}

TEST_F(MemoryImageTest, MissingRanges) {
    image->read(BLOCK_SIZE, 10);

    auto missing = image->missingRanges();
    ASSERT_EQ(2u, missing.size());
    EXPECT_EQ((std::pair<size_t, size_t>(0, 512)), missing[0]);
    EXPECT_EQ((std::pair<size_t, size_t>(1024, 4096)), missing[1]);
}

TEST_F(MemoryImageTest, StoredDataIsNotFetched) {
    image->store(2 * BLOCK_SIZE, Bytes(BLOCK_SIZE, 0x77));
    Bytes data = image->read(2 * BLOCK_SIZE, BLOCK_SIZE);
    EXPECT_EQ(0u, source->total());
    EXPECT_EQ(0x77, data[511]);
}

TEST_F(MemoryImageTest, OutOfRange) {
    EXPECT_THROW(image->read(8 * BLOCK_SIZE - 4, 10), std::out_of_range);
    EXPECT_THROW(image->store(8 * BLOCK_SIZE, Bytes{1}), std::out_of_range);
    EXPECT_FALSE(image->haveData(8 * BLOCK_SIZE, 1));
}

TEST(MemoryImageSourceTest, SourceFailureThrows) {
    auto source = std::make_shared<MockBlockSource>();
    MemoryImage image(source, 4 * BLOCK_SIZE);

    EXPECT_CALL(*source, fetchBlock(2, _, _))
        .WillOnce(DoAll(SetArgReferee<2>(std::string("timeout")), Return(false)))
        .WillOnce(DoAll(SetArgReferee<1>(Bytes(BLOCK_SIZE, 0x42)), Return(true)));

    try {
        image.read(1030, 4);
        FAIL() << "expected BlockUnavailableError";
    } catch (const BlockUnavailableError& e) {
        EXPECT_EQ(2u, e.blockIndex());
        EXPECT_THAT(e.what(), HasSubstr("timeout"));
    }
    EXPECT_FALSE(image.haveData(1024, 512));
    EXPECT_EQ(0u, image.fetchCount());

    // Retried on the next read
    EXPECT_EQ((Bytes{0x42, 0x42}), image.read(1030, 2));
    EXPECT_EQ(1u, image.fetchCount());
}

TEST(MemoryImageSourceTest, FlatImageIsComplete) {
    Bytes data(3 * BLOCK_SIZE, 0x10);
    auto image = MemoryImage::fromBytes(data);
    EXPECT_TRUE(image->haveData(0, data.size()));
    EXPECT_TRUE(image->missingRanges().empty());
    EXPECT_EQ(data, image->read(0, data.size()));
    EXPECT_EQ(0u, image->fetchCount());
}

TEST(MemoryImageSourceTest, SaveAndLoad) {
    auto source = std::make_shared<CountingSource>();
    MemoryImage image(source, 4 * BLOCK_SIZE);
    image.read(BLOCK_SIZE, 1);

    const std::string path = ::testing::TempDir() + "memory_image_test.bin";
    image.save(path);

    auto loaded = MemoryImage::fromFile(path);
    ASSERT_EQ(4 * BLOCK_SIZE, loaded->size());
    EXPECT_EQ(0, loaded->read(0, 1)[0]);
    EXPECT_EQ(1, loaded->read(BLOCK_SIZE, 1)[0]);
    EXPECT_EQ(0, loaded->read(2 * BLOCK_SIZE, 1)[0]);

    std::remove(path.c_str());
}
