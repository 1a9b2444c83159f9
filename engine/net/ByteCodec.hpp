#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace trisolar::net
{
/// Raw host-order copy. Every supported target is little-endian.
template <typename T>
void AppendValue(std::vector<std::uint8_t>& buffer, const T& value)
{
    static_assert(std::is_trivially_copyable_v<T>, "only trivially copyable values go on the wire");
    const std::uint8_t* ptr = reinterpret_cast<const std::uint8_t*>(&value);
    buffer.insert(buffer.end(), ptr, ptr + sizeof(T));
}

template <typename T>
bool ReadValue(const std::vector<std::uint8_t>& buffer, std::size_t& offset, T& outValue)
{
    static_assert(std::is_trivially_copyable_v<T>, "only trivially copyable values go on the wire");
    if (offset + sizeof(T) > buffer.size())
    {
        return false;
    }

    std::memcpy(&outValue, buffer.data() + offset, sizeof(T));
    offset += sizeof(T);
    return true;
}

/// uint16 length followed by the bytes, truncated to maxLength.
inline void AppendString(std::vector<std::uint8_t>& buffer, const std::string& value, std::size_t maxLength = 1024)
{
    const auto length = static_cast<std::uint16_t>(std::min<std::size_t>(value.size(), maxLength));
    AppendValue(buffer, length);
    buffer.insert(buffer.end(), value.begin(), value.begin() + length);
}

inline bool ReadString(const std::vector<std::uint8_t>& buffer, std::size_t& offset, std::string& outValue)
{
    std::uint16_t length = 0;
    if (!ReadValue(buffer, offset, length))
    {
        return false;
    }
    if (offset + length > buffer.size())
    {
        return false;
    }
    outValue.assign(reinterpret_cast<const char*>(buffer.data() + offset), length);
    offset += length;
    return true;
}

inline void AppendBool(std::vector<std::uint8_t>& buffer, bool value)
{
    AppendValue(buffer, static_cast<std::uint8_t>(value ? 1 : 0));
}

inline bool ReadBool(const std::vector<std::uint8_t>& buffer, std::size_t& offset, bool& outValue)
{
    std::uint8_t byte = 0;
    if (!ReadValue(buffer, offset, byte))
    {
        return false;
    }
    outValue = byte != 0;
    return true;
}
} // namespace trisolar::net
