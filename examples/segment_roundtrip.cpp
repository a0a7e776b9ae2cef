/**
 * @file segment_roundtrip.cpp
 * @brief 列式段写入与读取示例
 *
 * 写出一个包含若干列的段文件，再打开它列出所有列并读取负载
 */

#include "colstore/core/Exception.hpp"
#include "colstore/io/ByteSource.hpp"
#include "colstore/io/FileSink.hpp"
#include "colstore/segment/SegmentReader.hpp"
#include "colstore/segment/SegmentWriter.hpp"
#include "colstore/utils/ModuleLoggers.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace colstore;
using columnar::Cardinality;
using columnar::ColumnType;

namespace {

std::vector<uint8_t> encodeI64(const std::vector<int64_t>& values) {
    std::vector<uint8_t> out(values.size() * sizeof(int64_t));
    if (!values.empty()) {
        std::memcpy(out.data(), values.data(), out.size());
    }
    return out;
}

bool writeSegment(const std::string& path) {
    auto sink = std::make_unique<io::FileSink>(path);
    io::FileSink* file = sink.get();
    segment::SegmentWriter writer(std::move(sink));

    // 列必须按 (列名, 类型码) 递增写入
    {
        auto column = writer.beginColumn("attributes.color", {ColumnType::Str, Cardinality::Optional});
        if (auto result = column.writeAll("red\ngreen\nblue\n"); !result) {
            EXAMPLE_ERROR("Write failed: {}", result.error().fullMessage());
            return false;
        }
    }
    {
        auto column = writer.beginColumn("id", {ColumnType::I64, Cardinality::Required});
        if (auto result = column.writeAll(encodeI64({1, 2, 3})); !result) {
            EXAMPLE_ERROR("Write failed: {}", result.error().fullMessage());
            return false;
        }
    }
    {
        // 空列同样会登记
        auto column = writer.beginColumn("tags", {ColumnType::Str, Cardinality::Multivalued});
    }

    if (auto result = writer.finalize(); !result) {
        EXAMPLE_ERROR("Finalize failed: {}", result.error().fullMessage());
        return false;
    }
    if (auto result = file->close(); !result) {
        EXAMPLE_ERROR("Close failed: {}", result.error().fullMessage());
        return false;
    }
    EXAMPLE_INFO("Wrote {} columns, {} bytes to {}", writer.numColumns(), writer.writtenBytes(), path);
    return true;
}

bool readSegment(const std::string& path) {
    auto reader = segment::SegmentReader::open(std::make_shared<io::FileSource>(path));
    if (!reader) {
        EXAMPLE_ERROR("Open failed: {}", reader.error().fullMessage());
        return false;
    }

    auto columns = reader.value().listColumns();
    if (!columns) {
        EXAMPLE_ERROR("Listing failed: {}", columns.error().fullMessage());
        return false;
    }

    std::cout << "段中共有 " << columns.value().size() << " 列:" << std::endl;
    for (const auto& column : columns.value()) {
        std::cout << "  " << column.column_name
                  << " (" << columnar::toString(column.type_and_cardinality.type)
                  << ", " << columnar::toString(column.type_and_cardinality.cardinality)
                  << ") " << column.range.toString() << std::endl;
    }

    auto color = reader.value().readColumns("attributes.color");
    if (color && !color.value().empty()) {
        auto bytes = reader.value().readColumnBytes(color.value().front());
        if (bytes) {
            std::cout << "attributes.color 负载:\n"
                      << std::string(bytes.value().begin(), bytes.value().end());
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Logger::getInstance().initialize("logs/segment_roundtrip.log", Logger::Level::INFO, true);
    const std::string path = argc > 1 ? argv[1] : "example.seg";

    try {
        if (!writeSegment(path) || !readSegment(path)) {
            Logger::getInstance().shutdown();
            return 1;
        }
    } catch (const core::ColstoreException& e) {
        EXAMPLE_ERROR("Exception: {}", e.getDetailedMessage());
        Logger::getInstance().shutdown();
        return 1;
    }

    Logger::getInstance().shutdown();
    return 0;
}
