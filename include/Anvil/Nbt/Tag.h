#pragma once

/**
 * @file Tag.h
 * @brief In-memory tree for the structured tag format stored in chunks.
 */

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Anvil::Nbt {

enum class TagType : uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12
};

const char* tagTypeName(TagType type);

struct Tag;

struct ListTag {
    TagType elementType = TagType::End;
    std::vector<Tag> items;
};

class Compound {
public:
    const Tag* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    size_t size() const;

    void insert(std::string name, Tag tag);

    /// Payload of a child with the given name and type, or nullptr.
    template <typename T>
    const T* get(const std::string& name) const;

    const int8_t* getByte(const std::string& name) const { return get<int8_t>(name); }
    const int16_t* getShort(const std::string& name) const { return get<int16_t>(name); }
    const int32_t* getInt(const std::string& name) const { return get<int32_t>(name); }
    const int64_t* getLong(const std::string& name) const { return get<int64_t>(name); }
    const float* getFloat(const std::string& name) const { return get<float>(name); }
    const double* getDouble(const std::string& name) const { return get<double>(name); }
    const std::string* getString(const std::string& name) const { return get<std::string>(name); }
    const std::vector<int8_t>* getByteArray(const std::string& name) const { return get<std::vector<int8_t>>(name); }
    const std::vector<int32_t>* getIntArray(const std::string& name) const { return get<std::vector<int32_t>>(name); }
    const std::vector<int64_t>* getLongArray(const std::string& name) const { return get<std::vector<int64_t>>(name); }
    const ListTag* getList(const std::string& name) const { return get<ListTag>(name); }
    const Compound* getCompound(const std::string& name) const { return get<Compound>(name); }

    const std::unordered_map<std::string, Tag>& entries() const { return m_entries; }

private:
    std::unordered_map<std::string, Tag> m_entries;
};

/**
 * @brief One tag payload.
 *
 * Alternatives are declared in tag id order, so the variant index plus one
 * is the wire id of the tag.
 */
struct Tag {
    using Variant = std::variant<
        int8_t,
        int16_t,
        int32_t,
        int64_t,
        float,
        double,
        std::vector<int8_t>,
        std::string,
        ListTag,
        Compound,
        std::vector<int32_t>,
        std::vector<int64_t>>;

    Variant value;

    TagType type() const { return static_cast<TagType>(value.index() + 1); }
};

struct NamedTag {
    std::string name;
    Tag tag;

    /// Root payload as a compound. Only valid for tags returned by readRoot().
    const Compound& compound() const { return std::get<Compound>(tag.value); }
};

template <typename T>
const T* Compound::get(const std::string& name) const {
    const Tag* tag = find(name);
    if (!tag) {
        return nullptr;
    }
    return std::get_if<T>(&tag->value);
}

} // namespace Anvil::Nbt
