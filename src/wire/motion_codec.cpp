#include "wire/motion_codec.hpp"

#include <cstring>
#include <utility>

namespace flowstab::wire {

namespace {

constexpr std::size_t kPointBytes = 2 * sizeof(float);

void writePoints(const std::vector<cv::Point2f>& points, uint8_t* dst) {
    for (const auto& p : points) {
        std::memcpy(dst, &p.x, sizeof(float));
        std::memcpy(dst + sizeof(float), &p.y, sizeof(float));
        dst += kPointBytes;
    }
}

void readPoints(const uint8_t* src, std::size_t count, std::vector<cv::Point2f>& points) {
    points.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::memcpy(&points[i].x, src, sizeof(float));
        std::memcpy(&points[i].y, src + sizeof(float), sizeof(float));
        src += kPointBytes;
    }
}

}  // namespace

std::size_t encodedSize(const MotionRecord& record) {
    const std::size_t count = record.flow ? record.flow->size() : 0U;
    return sizeof(MotionHeader) + 2U * count * kPointBytes;
}

bool encodeMotionRecord(const MotionRecord& record, std::vector<uint8_t>& out, std::string& error) {
    if (record.flow && record.flow->origins.size() != record.flow->destinations.size()) {
        error = "origins and destinations differ in length";
        return false;
    }

    MotionHeader header = makeMotionHeader();
    header.has_flow = record.flow ? 1U : 0U;
    header.point_count = record.flow ? static_cast<uint32_t>(record.flow->size()) : 0U;
    header.timestamp_ns = record.timestamp_ns;

    out.assign(encodedSize(record), 0U);
    std::memcpy(out.data(), &header, sizeof(header));
    if (record.flow) {
        uint8_t* cursor = out.data() + sizeof(header);
        writePoints(record.flow->origins, cursor);
        writePoints(record.flow->destinations, cursor + record.flow->size() * kPointBytes);
    }
    error.clear();
    return true;
}

bool decodeMotionRecord(const uint8_t* data, std::size_t size, MotionRecord& out, std::string& error) {
    if (data == nullptr || size < sizeof(MotionHeader)) {
        error = "motion payload shorter than header";
        return false;
    }

    MotionHeader header{};
    std::memcpy(&header, data, sizeof(header));
    if (header.magic != kMotionMagic) {
        error = "motion payload has wrong magic";
        return false;
    }
    if (header.protocol_version != kMotionProtocolVersion) {
        error = "motion protocol mismatch: got " + std::to_string(header.protocol_version) +
                ", expected " + std::to_string(kMotionProtocolVersion);
        return false;
    }
    if (header.has_flow > 1U || (header.has_flow == 0U && header.point_count != 0U)) {
        error = "motion payload header is inconsistent";
        return false;
    }

    const std::size_t count = header.point_count;
    const std::size_t expected = sizeof(MotionHeader) + 2U * count * kPointBytes;
    if (size != expected) {
        error = "motion payload size " + std::to_string(size) + " does not match " + std::to_string(expected);
        return false;
    }

    MotionRecord record;
    record.timestamp_ns = header.timestamp_ns;
    if (header.has_flow != 0U) {
        Correspondences flow;
        const uint8_t* cursor = data + sizeof(MotionHeader);
        readPoints(cursor, count, flow.origins);
        readPoints(cursor + count * kPointBytes, count, flow.destinations);
        record.flow = std::move(flow);
    }

    out = std::move(record);
    error.clear();
    return true;
}

bool decodeMotionRecord(const std::vector<uint8_t>& payload, MotionRecord& out, std::string& error) {
    return decodeMotionRecord(payload.data(), payload.size(), out, error);
}

bool makeMotionBuffer(const MotionRecord& record, const BufferMeta& meta, MotionBuffer& out, std::string& error) {
    MotionBuffer buffer;
    buffer.meta = meta;
    if (!encodeMotionRecord(record, buffer.payload, error)) {
        return false;
    }
    out = std::move(buffer);
    return true;
}

}  // namespace flowstab::wire
