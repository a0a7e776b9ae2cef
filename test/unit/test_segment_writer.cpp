#include <gtest/gtest.h>
#include "colstore/core/Exception.hpp"
#include "colstore/io/BinaryUtils.hpp"
#include "colstore/io/ByteSource.hpp"
#include "colstore/io/MemorySink.hpp"
#include "colstore/segment/SegmentReader.hpp"
#include "colstore/segment/SegmentWriter.hpp"
#include "colstore/sstable/SSTableReader.hpp"
#include "colstore/utils/Logger.hpp"
#include "TestSinks.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace colstore;
using namespace colstore::segment;
using colstore::columnar::Cardinality;
using colstore::columnar::ColumnType;
using colstore::columnar::ColumnTypeAndCardinality;
using colstore::sstable::ByteRange;
using colstore::test::ScriptedSink;

class SegmentWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/segment_writer_test.log", Logger::Level::DEBUG, false);
        auto sink = std::make_unique<io::MemorySink>();
        sink_ = sink.get();
        writer_ = std::make_unique<SegmentWriter>(std::move(sink));
    }

    void TearDown() override {
        writer_.reset();
        Logger::getInstance().shutdown();
    }

    // 解析整段输出：尾部 -> 索引 -> 条目
    std::vector<sstable::SSTableReader::Entry> indexEntries() const {
        const std::vector<uint8_t>& bytes = sink_->data();
        EXPECT_GE(bytes.size(), 8u);
        uint64_t index_len = io::readU64LE(bytes.data() + bytes.size() - 8);
        std::vector<uint8_t> index(bytes.end() - 8 - static_cast<std::ptrdiff_t>(index_len), bytes.end() - 8);
        auto reader = sstable::SSTableReader::open(std::move(index));
        EXPECT_TRUE(reader.hasValue());
        auto entries = reader.value().entries();
        EXPECT_TRUE(entries.hasValue());
        return std::move(entries).value();
    }

    static std::string key(std::string_view name, ColumnTypeAndCardinality tc) {
        std::string k(name);
        k.push_back('\0');
        k.push_back(static_cast<char>(tc.toCode()));
        return k;
    }

    const ColumnTypeAndCardinality i64_{ColumnType::I64, Cardinality::Required};
    const ColumnTypeAndCardinality str_{ColumnType::Str, Cardinality::Optional};

    io::MemorySink* sink_ = nullptr;
    std::unique_ptr<SegmentWriter> writer_;
};

TEST_F(SegmentWriterTest, ThreeColumnsIncludingEmpty) {
    {
        auto column = writer_->beginColumn("a", i64_);
        ASSERT_TRUE(column.writeAll("abcd").hasValue());
    }
    {
        auto column = writer_->beginColumn("b", i64_);
    }
    {
        auto column = writer_->beginColumn("c", i64_);
        ASSERT_TRUE(column.writeAll("0123456789").hasValue());
    }
    ASSERT_TRUE(writer_->finalize().hasValue());
    EXPECT_EQ(writer_->numColumns(), 3u);

    auto entries = indexEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, key("a", i64_));
    EXPECT_EQ(entries[0].value, ByteRange(0, 4));
    EXPECT_EQ(entries[1].key, key("b", i64_));
    EXPECT_EQ(entries[1].value, ByteRange(4, 4));
    EXPECT_EQ(entries[2].key, key("c", i64_));
    EXPECT_EQ(entries[2].value, ByteRange(4, 14));

    const std::vector<uint8_t>& bytes = sink_->data();
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 14), "abcd0123456789");
}

TEST_F(SegmentWriterTest, EmptySegmentHasIndexAndTrailer) {
    ASSERT_TRUE(writer_->finalize().hasValue());

    const std::vector<uint8_t>& bytes = sink_->data();
    ASSERT_GE(bytes.size(), 8u);
    uint64_t index_len = io::readU64LE(bytes.data() + bytes.size() - 8);
    EXPECT_EQ(index_len + 8, bytes.size());
    EXPECT_TRUE(indexEntries().empty());
}

TEST_F(SegmentWriterTest, TrailerMatchesIndexLength) {
    const std::vector<uint8_t> payload = test::makePayload(1000);
    for (const char* name : {"alpha", "beta", "gamma"}) {
        auto column = writer_->beginColumn(name, str_);
        ASSERT_TRUE(column.writeAll(payload).hasValue());
    }
    ASSERT_TRUE(writer_->finalize().hasValue());

    const std::vector<uint8_t>& bytes = sink_->data();
    uint64_t index_len = io::readU64LE(bytes.data() + bytes.size() - 8);
    EXPECT_EQ(3000 + index_len + 8, bytes.size());
    EXPECT_EQ(writer_->writtenBytes(), bytes.size());
}

TEST_F(SegmentWriterTest, ColumnsAreContiguous) {
    const char* names[] = {"c0", "c1", "c2", "c3", "c4"};
    const size_t sizes[] = {7, 0, 4096, 1, 33};
    for (size_t i = 0; i < 5; ++i) {
        auto column = writer_->beginColumn(names[i], i64_);
        EXPECT_EQ(column.startOffset(), writer_->writtenBytes());
        const std::vector<uint8_t> payload = test::makePayload(sizes[i], static_cast<uint8_t>(i));
        // 分块写入
        size_t pos = 0;
        while (pos < payload.size()) {
            size_t chunk = std::min<size_t>(100, payload.size() - pos);
            ASSERT_TRUE(column.writeAll(payload.data() + pos, chunk).hasValue());
            pos += chunk;
        }
        EXPECT_EQ(column.bytesWritten(), sizes[i]);
    }
    ASSERT_TRUE(writer_->finalize().hasValue());

    auto entries = indexEntries();
    ASSERT_EQ(entries.size(), 5u);
    uint64_t expected_start = 0;
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(entries[i].value.start, expected_start);
        EXPECT_EQ(entries[i].value.length(), sizes[i]);
        expected_start = entries[i].value.end;
    }
}

TEST_F(SegmentWriterTest, CloseIsIdempotent) {
    auto column = writer_->beginColumn("a", i64_);
    ASSERT_TRUE(column.writeAll("xyz").hasValue());
    EXPECT_TRUE(writer_->hasOpenColumn());

    column.close();
    EXPECT_FALSE(column.isOpen());
    EXPECT_FALSE(writer_->hasOpenColumn());
    EXPECT_EQ(column.bytesWritten(), 3u);
    column.close();
    EXPECT_EQ(writer_->numColumns(), 1u);

    auto write = column.writeAll("more");
    ASSERT_TRUE(write.hasError());
    EXPECT_EQ(write.error().code, core::ErrorCode::InvalidState);
    EXPECT_EQ(column.flush().error().code, core::ErrorCode::InvalidState);
    uint8_t byte = 0;
    EXPECT_EQ(column.write(&byte, 1).error().code, core::ErrorCode::InvalidState);

    ASSERT_TRUE(writer_->finalize().hasValue());
    EXPECT_EQ(indexEntries().size(), 1u);
}

TEST_F(SegmentWriterTest, MovedRecorderRegistersOnce) {
    {
        auto column = writer_->beginColumn("a", i64_);
        ASSERT_TRUE(column.writeAll("12").hasValue());
        ColumnSpanRecorder moved(std::move(column));
        EXPECT_FALSE(column.isOpen());
        EXPECT_TRUE(moved.isOpen());
        ASSERT_TRUE(moved.writeAll("34").hasValue());
    }
    EXPECT_EQ(writer_->numColumns(), 1u);
    ASSERT_TRUE(writer_->finalize().hasValue());

    auto entries = indexEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].value, ByteRange(0, 4));
}

TEST_F(SegmentWriterTest, BeginWhileColumnOpenThrows) {
    auto column = writer_->beginColumn("a", i64_);
    EXPECT_THROW(writer_->beginColumn("b", i64_), core::OperationException);
    EXPECT_THROW(writer_->finalize(), core::OperationException);
    column.close();

    ASSERT_TRUE(writer_->finalize().hasValue());
    EXPECT_THROW(writer_->finalize(), core::OperationException);
    EXPECT_THROW(writer_->beginColumn("z", i64_), core::OperationException);
}

TEST_F(SegmentWriterTest, NameWithSeparatorIsRejected) {
    EXPECT_THROW(writer_->beginColumn(std::string("root\0child", 10), i64_), core::ParameterException);
    EXPECT_FALSE(writer_->hasOpenColumn());

    // 拒绝后写入器仍可用
    {
        auto column = writer_->beginColumn("root", i64_);
    }
    ASSERT_TRUE(writer_->finalize().hasValue());
}

TEST_F(SegmentWriterTest, SameNameDifferentTypesInCodeOrder) {
    {
        auto column = writer_->beginColumn("attr", {ColumnType::I64, Cardinality::Required});
        ASSERT_TRUE(column.writeAll("i").hasValue());
    }
    {
        auto column = writer_->beginColumn("attr", {ColumnType::Str, Cardinality::Required});
        ASSERT_TRUE(column.writeAll("s").hasValue());
    }
    {
        auto column = writer_->beginColumn("attr", {ColumnType::I64, Cardinality::Multivalued});
        ASSERT_TRUE(column.writeAll("m").hasValue());
    }
    {
        auto column = writer_->beginColumn("attr.sub", {ColumnType::I64, Cardinality::Required});
    }
    ASSERT_TRUE(writer_->finalize().hasValue());
    EXPECT_EQ(indexEntries().size(), 4u);
}

TEST_F(SegmentWriterTest, OutOfOrderColumnTerminates) {
    EXPECT_DEATH({
        test::logCriticalToStderr("logs/segment_writer_test.log");
        SegmentWriter writer(std::make_unique<io::MemorySink>());
        { auto column = writer.beginColumn("b", i64_); }
        { auto column = writer.beginColumn("a", i64_); }
    }, "not after the previous column");
}

TEST_F(SegmentWriterTest, DuplicateColumnTerminates) {
    EXPECT_DEATH({
        test::logCriticalToStderr("logs/segment_writer_test.log");
        SegmentWriter writer(std::make_unique<io::MemorySink>());
        { auto column = writer.beginColumn("a", i64_); }
        { auto column = writer.beginColumn("a", i64_); }
    }, "not after the previous column");
}

TEST_F(SegmentWriterTest, ShorterNameMustComeFirst) {
    EXPECT_DEATH({
        test::logCriticalToStderr("logs/segment_writer_test.log");
        SegmentWriter writer(std::make_unique<io::MemorySink>());
        { auto column = writer.beginColumn("ab", i64_); }
        { auto column = writer.beginColumn("a", i64_); }
    }, "not after the previous column");
}

TEST_F(SegmentWriterTest, WriterDestroyedWithOpenColumnTerminates) {
    EXPECT_DEATH({
        test::logCriticalToStderr("logs/segment_writer_test.log");
        auto writer = std::make_unique<SegmentWriter>(std::make_unique<io::MemorySink>());
        auto column = writer->beginColumn("a", i64_);
        ASSERT_TRUE(column.writeAll("xyz").hasValue());
        writer.reset();
    }, "destroyed while column 0 is still open at offset 3");
}

TEST_F(SegmentWriterTest, WrittenBytesMatchesSink) {
    {
        auto column = writer_->beginColumn("a", i64_);
        ASSERT_TRUE(column.writeAll(test::makePayload(123)).hasValue());
        EXPECT_EQ(writer_->writtenBytes(), 123u);
        EXPECT_EQ(column.bytesWritten(), 123u);
    }
    EXPECT_EQ(sink_->size(), 123u);
    EXPECT_EQ(&writer_->sink(), sink_);
}

class SegmentWriterIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/segment_writer_io_test.log", Logger::Level::DEBUG, false);
        state_ = std::make_shared<ScriptedSink::State>();
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    std::shared_ptr<ScriptedSink::State> state_;
    const ColumnTypeAndCardinality type_{ColumnType::Bytes, Cardinality::Required};
};

TEST_F(SegmentWriterIoTest, PartialWritesStillProduceExactRanges) {
    state_->max_chunk = 3;
    {
        SegmentWriter writer(std::make_unique<ScriptedSink>(state_));
        {
            auto column = writer.beginColumn("a", type_);
            const std::vector<uint8_t> payload = test::makePayload(10);
            auto first = column.write(payload.data(), payload.size());
            ASSERT_TRUE(first.hasValue());
            EXPECT_EQ(first.value(), 3u);
            EXPECT_EQ(column.bytesWritten(), 3u);
            ASSERT_TRUE(column.writeAll(payload.data() + 3, 7).hasValue());
        }
        ASSERT_TRUE(writer.finalize().hasValue());
    }

    auto source = std::make_shared<io::MemorySource>(state_->bytes);
    auto reader = SegmentReader::open(source);
    ASSERT_TRUE(reader.hasValue());
    auto columns = reader.value().listColumns();
    ASSERT_TRUE(columns.hasValue());
    ASSERT_EQ(columns.value().size(), 1u);
    EXPECT_EQ(columns.value()[0].range, ByteRange(0, 10));
}

TEST_F(SegmentWriterIoTest, ColumnWriteFailureIsReported) {
    state_->fail_after = 4;
    SegmentWriter writer(std::make_unique<ScriptedSink>(state_));
    {
        auto column = writer.beginColumn("a", type_);
        auto result = column.writeAll(test::makePayload(10));
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code, core::ErrorCode::IoError);
        EXPECT_EQ(column.bytesWritten(), 4u);
    }
    // 失败的列仍按已确认的字节登记
    EXPECT_EQ(writer.numColumns(), 1u);
}

TEST_F(SegmentWriterIoTest, StalledSinkErrorNamesTheWriter) {
    state_->max_chunk = 0;
    SegmentWriter writer(std::make_unique<ScriptedSink>(state_));
    {
        auto column = writer.beginColumn("a", type_);
        auto result = column.writeAll("abc");
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code, core::ErrorCode::IoError);
        EXPECT_EQ(result.error().context, "CountingWriter<ScriptedSink>");
        EXPECT_EQ(column.bytesWritten(), 0u);
    }
    EXPECT_EQ(writer.numColumns(), 1u);
}

TEST_F(SegmentWriterIoTest, FinalizeWriteFailureIsReported) {
    state_->fail_after = 5;
    SegmentWriter writer(std::make_unique<ScriptedSink>(state_));
    {
        auto column = writer.beginColumn("a", type_);
        ASSERT_TRUE(column.writeAll("12345").hasValue());
    }
    auto result = writer.finalize();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, core::ErrorCode::IoError);
    EXPECT_TRUE(writer.isFinalized());
    EXPECT_THROW(writer.finalize(), core::OperationException);
}

TEST_F(SegmentWriterIoTest, FlushFailureIsReported) {
    state_->fail_flush = true;
    SegmentWriter writer(std::make_unique<ScriptedSink>(state_));
    {
        auto column = writer.beginColumn("a", type_);
        EXPECT_EQ(column.flush().error().code, core::ErrorCode::IoError);
    }
    EXPECT_TRUE(writer.finalize().hasError());
    EXPECT_EQ(state_->flush_calls, 2u);
}

TEST_F(SegmentWriterIoTest, FinalizeWithoutFlush) {
    SegmentWriterOptions options;
    options.flush_on_finalize = false;
    SegmentWriter writer(std::make_unique<ScriptedSink>(state_), options);
    ASSERT_TRUE(writer.finalize().hasValue());
    EXPECT_EQ(state_->flush_calls, 0u);
    EXPECT_FALSE(state_->bytes.empty());
}

TEST_F(SegmentWriterIoTest, SmallIndexBlocks) {
    SegmentWriterOptions options;
    options.index_block_size = 32;
    {
        SegmentWriter writer(std::make_unique<ScriptedSink>(state_), options);
        for (int i = 0; i < 200; ++i) {
            auto column = writer.beginColumn(fmt::format("field_{:04}", i), type_);
            ASSERT_TRUE(column.writeAll(std::string(static_cast<size_t>(i % 7), 'x')).hasValue());
        }
        ASSERT_TRUE(writer.finalize().hasValue());
    }

    auto reader = SegmentReader::open(std::make_shared<io::MemorySource>(state_->bytes));
    ASSERT_TRUE(reader.hasValue());
    EXPECT_EQ(reader.value().numColumns(), 200u);
    auto found = reader.value().findColumn("field_0123", type_);
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->numBytes(), 123u % 7);
}
