#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace std_fs = std::filesystem;

namespace SvgServe::fs
{

// read the whole file as binary, return false when it can't be opened or read completely
template <typename T, typename = typename std::enable_if_t<
                          std::disjunction_v<std::is_same<T, std::vector<std::uint8_t>>, std::is_same<T, std::string>>>>
inline bool ReadFile(std::string_view path, T& output) {
    std::ifstream file(std::string(path), std::ios::binary);
    if (!file) return false;
    file.seekg(0, file.end);
    auto lengthInBytes = file.tellg();
    if (lengthInBytes < 0) return false;
    file.seekg(0, file.beg);

    output.resize(static_cast<std::size_t>(lengthInBytes));
    if (lengthInBytes == 0) return true;
    file.read(reinterpret_cast<char*>(output.data()), lengthInBytes);
    return file.gcount() == lengthInBytes;
}

inline bool WriteFile(std::string_view path, const void* data, std::size_t len, bool override = true) {
    if (path.empty()) return false;
    // App mode means append mode, trunc mode means overwrite
    std::ios_base::openmode mode = override ? std::ios::trunc : std::ios::app;
    mode |= (std::ios::binary | std::ios::out);

    std::ofstream file(std::string(path), mode);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    file.flush();
    return static_cast<bool>(file);
}

} // namespace SvgServe::fs
