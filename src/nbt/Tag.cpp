#include "Anvil/Nbt/Tag.h"

namespace Anvil::Nbt {

const char* tagTypeName(TagType type) {
    switch (type) {
    case TagType::End:
        return "End";
    case TagType::Byte:
        return "Byte";
    case TagType::Short:
        return "Short";
    case TagType::Int:
        return "Int";
    case TagType::Long:
        return "Long";
    case TagType::Float:
        return "Float";
    case TagType::Double:
        return "Double";
    case TagType::ByteArray:
        return "ByteArray";
    case TagType::String:
        return "String";
    case TagType::List:
        return "List";
    case TagType::Compound:
        return "Compound";
    case TagType::IntArray:
        return "IntArray";
    case TagType::LongArray:
        return "LongArray";
    }
    return "Unknown";
}

const Tag* Compound::find(const std::string& name) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return &it->second;
}

bool Compound::contains(const std::string& name) const {
    return m_entries.find(name) != m_entries.end();
}

size_t Compound::size() const {
    return m_entries.size();
}

void Compound::insert(std::string name, Tag tag) {
    m_entries.insert_or_assign(std::move(name), std::move(tag));
}

} // namespace Anvil::Nbt
