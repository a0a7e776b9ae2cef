#pragma once

#include "colstore/io/ByteSink.hpp"
#include "colstore/utils/Logger.hpp"
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace colstore {
namespace test {

// 测试用字节流：共享缓冲，可限制单次写入大小，可在写满limit后失败
class ScriptedSink : public io::IByteSink {
public:
    struct State {
        std::vector<uint8_t> bytes;
        size_t max_chunk = SIZE_MAX;   // 单次write最多接受的字节数
        size_t fail_after = SIZE_MAX;  // 累计写入达到该值后write返回错误
        bool fail_flush = false;
        size_t write_calls = 0;
        size_t flush_calls = 0;
    };

    explicit ScriptedSink(std::shared_ptr<State> state) : state_(std::move(state)) {}

    core::Result<size_t> write(const uint8_t* data, size_t size) override {
        ++state_->write_calls;
        if (size > 0 && state_->bytes.size() >= state_->fail_after) {
            return core::makeError(core::ErrorCode::IoError, "scripted write failure");
        }
        size_t accepted = std::min({size, state_->max_chunk, state_->fail_after - state_->bytes.size()});
        state_->bytes.insert(state_->bytes.end(), data, data + accepted);
        return accepted;
    }

    core::VoidResult flush() override {
        ++state_->flush_calls;
        if (state_->fail_flush) {
            return core::makeError(core::ErrorCode::IoError, "scripted flush failure");
        }
        return {};
    }

    std::string getTypeName() const override { return "ScriptedSink"; }

private:
    std::shared_ptr<State> state_;
};

inline std::vector<uint8_t> makePayload(size_t size, uint8_t seed = 0) {
    std::vector<uint8_t> payload(size);
    for (size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return payload;
}

// 死亡测试子进程中重新打开控制台输出，使CRITICAL日志到达stderr供正则匹配
inline void logCriticalToStderr(const std::string& log_file_path) {
    Logger::getInstance().shutdown();
    Logger::getInstance().initialize(log_file_path, Logger::Level::DEBUG, true);
}

}} // namespace colstore::test
