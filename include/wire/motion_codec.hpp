#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "core/types.hpp"

namespace flowstab::wire {

constexpr uint32_t kMotionProtocolVersion = 1;
constexpr uint32_t kMotionMagic = 0x574F4C46U;  // "FLOW"

// Payload layout: header, then point_count origin (x, y) float pairs, then
// point_count destination pairs. Host byte order.
#pragma pack(push, 1)
struct MotionHeader {
    uint32_t protocol_version;
    uint32_t magic;
    uint8_t has_flow;
    uint8_t reserved[3];
    uint32_t point_count;
    int64_t timestamp_ns;
};
#pragma pack(pop)

static_assert(std::is_trivially_copyable<MotionHeader>::value, "MotionHeader must be trivially copyable");
static_assert(sizeof(MotionHeader) == 24, "MotionHeader ABI size changed");

inline MotionHeader makeMotionHeader() {
    MotionHeader h{};
    h.protocol_version = kMotionProtocolVersion;
    h.magic = kMotionMagic;
    return h;
}

std::size_t encodedSize(const MotionRecord& record);
bool encodeMotionRecord(const MotionRecord& record, std::vector<uint8_t>& out, std::string& error);
bool decodeMotionRecord(const uint8_t* data, std::size_t size, MotionRecord& out, std::string& error);
bool decodeMotionRecord(const std::vector<uint8_t>& payload, MotionRecord& out, std::string& error);

// Encodes `record` and stamps the result with the metadata of the frame it was computed on.
bool makeMotionBuffer(const MotionRecord& record, const BufferMeta& meta, MotionBuffer& out, std::string& error);

}  // namespace flowstab::wire
