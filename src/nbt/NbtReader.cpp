#include "Anvil/Nbt/NbtReader.h"

#include "Anvil/Region/BigEndian.h"
#include "Anvil/Region/RegionError.h"

#include <bit>
#include <string>

namespace Anvil::Nbt {

namespace {

using Region::ErrorKind;
using Region::RegionError;

class Cursor {
public:
    explicit Cursor(std::span<const uint8_t> data)
        : m_data(data) {
    }

    uint8_t readU8() {
        ensure(1);
        return m_data[m_pos++];
    }

    uint16_t readU16() {
        ensure(2);
        uint16_t value = static_cast<uint16_t>(Region::readU16BE(m_data, m_pos));
        m_pos += 2;
        return value;
    }

    uint32_t readU32() {
        ensure(4);
        uint32_t value = Region::readU32BE(m_data, m_pos);
        m_pos += 4;
        return value;
    }

    uint64_t readU64() {
        ensure(8);
        uint64_t value = Region::readU64BE(m_data, m_pos);
        m_pos += 8;
        return value;
    }

    int32_t readLength() {
        int32_t length = static_cast<int32_t>(readU32());
        if (length < 0) {
            throw RegionError(ErrorKind::TagDecodeError,
                "negative length " + std::to_string(length) + " at offset " + std::to_string(m_pos - 4));
        }
        return length;
    }

    std::string readString() {
        uint16_t length = readU16();
        ensure(length);
        std::string out(reinterpret_cast<const char*>(m_data.data() + m_pos), length);
        m_pos += length;
        return out;
    }

    // Rejects element counts that cannot fit in the remaining bytes before allocating.
    void ensureElements(size_t count, size_t elementSize) {
        if (elementSize != 0 && count > (m_data.size() - m_pos) / elementSize) {
            fail("array of " + std::to_string(count) + " elements");
        }
    }

    size_t tell() const { return m_pos; }

private:
    void ensure(size_t len) {
        if (len > m_data.size() - m_pos) {
            fail(std::to_string(len) + " bytes");
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw RegionError(ErrorKind::TagDecodeError,
            "unexpected end of tag data reading " + what + " at offset " + std::to_string(m_pos));
    }

    std::span<const uint8_t> m_data;
    size_t m_pos = 0;
};

TagType tagTypeFromByte(uint8_t value, size_t offset) {
    if (value > static_cast<uint8_t>(TagType::LongArray)) {
        throw RegionError(ErrorKind::TagDecodeError,
            "unknown tag id " + std::to_string(static_cast<int>(value)) + " at offset " + std::to_string(offset));
    }
    return static_cast<TagType>(value);
}

Tag readPayload(Cursor& cursor, TagType type, size_t depth);

template <typename T, typename ReadFn>
std::vector<T> readArray(Cursor& cursor, size_t elementSize, ReadFn read) {
    int32_t length = cursor.readLength();
    cursor.ensureElements(static_cast<size_t>(length), elementSize);
    std::vector<T> out;
    out.reserve(static_cast<size_t>(length));
    for (int32_t i = 0; i < length; ++i) {
        out.push_back(read());
    }
    return out;
}

Compound readCompound(Cursor& cursor, size_t depth) {
    Compound compound;
    while (true) {
        size_t offset = cursor.tell();
        TagType type = tagTypeFromByte(cursor.readU8(), offset);
        if (type == TagType::End) {
            break;
        }
        std::string name = cursor.readString();
        compound.insert(std::move(name), readPayload(cursor, type, depth + 1));
    }
    return compound;
}

ListTag readList(Cursor& cursor, size_t depth) {
    ListTag list;
    size_t offset = cursor.tell();
    list.elementType = tagTypeFromByte(cursor.readU8(), offset);
    int32_t length = cursor.readLength();
    if (list.elementType == TagType::End) {
        // Empty lists are written with element type End; anything else is malformed.
        if (length != 0) {
            throw RegionError(ErrorKind::TagDecodeError,
                "list of End tags with length " + std::to_string(length));
        }
        return list;
    }
    cursor.ensureElements(static_cast<size_t>(length), 1);
    list.items.reserve(static_cast<size_t>(length));
    for (int32_t i = 0; i < length; ++i) {
        list.items.push_back(readPayload(cursor, list.elementType, depth + 1));
    }
    return list;
}

Tag readPayload(Cursor& cursor, TagType type, size_t depth) {
    if (depth > MaxDepth) {
        throw RegionError(ErrorKind::TagDecodeError,
            "tag nesting exceeds " + std::to_string(MaxDepth) + " levels");
    }

    Tag tag;
    switch (type) {
    case TagType::Byte:
        tag.value = static_cast<int8_t>(cursor.readU8());
        break;
    case TagType::Short:
        tag.value = static_cast<int16_t>(cursor.readU16());
        break;
    case TagType::Int:
        tag.value = static_cast<int32_t>(cursor.readU32());
        break;
    case TagType::Long:
        tag.value = static_cast<int64_t>(cursor.readU64());
        break;
    case TagType::Float:
        tag.value = std::bit_cast<float>(cursor.readU32());
        break;
    case TagType::Double:
        tag.value = std::bit_cast<double>(cursor.readU64());
        break;
    case TagType::ByteArray:
        tag.value = readArray<int8_t>(cursor, 1, [&] { return static_cast<int8_t>(cursor.readU8()); });
        break;
    case TagType::String:
        tag.value = cursor.readString();
        break;
    case TagType::List:
        tag.value = readList(cursor, depth);
        break;
    case TagType::Compound:
        tag.value = readCompound(cursor, depth);
        break;
    case TagType::IntArray:
        tag.value = readArray<int32_t>(cursor, 4, [&] { return static_cast<int32_t>(cursor.readU32()); });
        break;
    case TagType::LongArray:
        tag.value = readArray<int64_t>(cursor, 8, [&] { return static_cast<int64_t>(cursor.readU64()); });
        break;
    case TagType::End:
        throw RegionError(ErrorKind::TagDecodeError, "unexpected End tag payload");
    }
    return tag;
}

} // namespace

NamedTag readRoot(std::span<const uint8_t> bytes) {
    Cursor cursor(bytes);
    TagType type = tagTypeFromByte(cursor.readU8(), 0);
    if (type != TagType::Compound) {
        throw RegionError(ErrorKind::TagDecodeError,
            std::string("root tag is ") + tagTypeName(type) + ", expected Compound");
    }
    NamedTag root;
    root.name = cursor.readString();
    root.tag = readPayload(cursor, type, 0);
    return root;
}

} // namespace Anvil::Nbt
