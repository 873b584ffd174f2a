/**
 * @file Snapshot.cpp
 * @brief Codificação e validação de snapshots.
 */
#include "Snapshot.hpp"
#include "Config.hpp"
#include "Log.hpp"

namespace polymaze {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFFu));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v & 0xFFFFu));
    put_u16(out, static_cast<uint16_t>(v >> 16));
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(get_u16(p)) | (static_cast<uint32_t>(get_u16(p + 2)) << 16);
}

/// Máscara com todas as paredes que a sala `pos` possui.
Mask room_mask(Shape shape, Pos pos) {
    Mask m = 0;
    for (const Wall* wall : walls(shape, pos)) m |= wall->mask();
    return m;
}

} // namespace

std::vector<uint8_t> encode_snapshot_records(Shape shape, int width, int height,
                                             const std::vector<uint16_t>& records) {
    const std::size_t rooms = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    if (width < 0 || height < 0 || width > 0xFFFF || height > 0xFFFF
        || rooms > POLYMAZE_CFG_SNAPSHOT_MAX_ROOMS || records.size() != rooms) {
        POLYMAZE_WARN("SNAP", "encode: unsupported dimensions %dx%d", width, height);
        return {};
    }

    std::vector<uint8_t> out;
    out.reserve(SNAPSHOT_HEADER_SIZE + 2 * rooms);
    put_u32(out, SNAPSHOT_MAGIC);
    put_u16(out, SNAPSHOT_VERSION);
    out.push_back(static_cast<uint8_t>(shape));
    out.push_back(0); // reservado
    put_u16(out, static_cast<uint16_t>(width));
    put_u16(out, static_cast<uint16_t>(height));
    put_u32(out, static_cast<uint32_t>(2 * rooms));
    for (uint16_t r : records) put_u16(out, r);
    POLYMAZE_LOG("SNAP", "encode ok (%s %dx%d, %u bytes)", shape_name(shape), width, height,
                 static_cast<unsigned>(out.size()));
    return out;
}

std::optional<SnapshotData> parse_snapshot(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < SNAPSHOT_HEADER_SIZE) {
        POLYMAZE_WARN("SNAP", "decode: truncated header (%u bytes)", static_cast<unsigned>(bytes.size()));
        return std::nullopt;
    }
    const uint8_t* p = bytes.data();
    const uint32_t magic = get_u32(p);
    const uint16_t version = get_u16(p + 4);
    if (magic != SNAPSHOT_MAGIC || version != SNAPSHOT_VERSION) {
        POLYMAZE_WARN("SNAP", "decode: bad magic/version (0x%08X v%u)", magic, version);
        return std::nullopt;
    }
    const auto shape = shape_from_walls(p[6]);
    if (!shape) {
        POLYMAZE_WARN("SNAP", "decode: invalid shape tag %u", static_cast<unsigned>(p[6]));
        return std::nullopt;
    }
    const int width = get_u16(p + 8);
    const int height = get_u16(p + 10);
    const uint32_t size = get_u32(p + 12);
    const std::size_t rooms = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    if (rooms > POLYMAZE_CFG_SNAPSHOT_MAX_ROOMS || size != 2 * rooms
        || bytes.size() != SNAPSHOT_HEADER_SIZE + size) {
        POLYMAZE_WARN("SNAP", "decode: size mismatch (%dx%d, payload %u, buffer %u)", width, height,
                      size, static_cast<unsigned>(bytes.size()));
        return std::nullopt;
    }

    SnapshotData data;
    data.shape = *shape;
    data.width = width;
    data.height = height;
    data.records.reserve(rooms);
    for (std::size_t i = 0; i < rooms; ++i) {
        data.records.push_back(get_u16(p + SNAPSHOT_HEADER_SIZE + 2 * i));
    }

    // Cada registro só pode abrir paredes da própria sala, e os dois lados precisam concordar
    Matrix<Mask> masks(width, height, 0u);
    std::size_t i = 0;
    for (Pos pos : masks.positions()) masks[pos] = data.records[i++] & 0x7FFFu;
    for (Pos pos : masks.positions()) {
        const Mask m = masks[pos];
        if ((m & ~room_mask(data.shape, pos)) != 0) {
            POLYMAZE_WARN("SNAP", "decode: foreign wall bits 0x%04X at (%d,%d)", m, pos.col, pos.row);
            return std::nullopt;
        }
        for (const Wall* wall : walls(data.shape, pos)) {
            const WallPos other = back(data.shape, WallPos{pos, wall});
            const Mask* om = masks.get(other.pos);
            if (!om) continue;
            if (((m & wall->mask()) != 0) != ((*om & other.wall->mask()) != 0)) {
                POLYMAZE_WARN("SNAP", "decode: asymmetric wall %s at (%d,%d)", wall->name, pos.col, pos.row);
                return std::nullopt;
            }
        }
    }

    POLYMAZE_LOG("SNAP", "decode ok (%s %dx%d)", shape_name(data.shape), width, height);
    return data;
}

} // namespace polymaze
