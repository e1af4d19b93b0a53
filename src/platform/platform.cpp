// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "reghive/platform.hpp"

#include <fstream>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#endif

namespace reghive::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

std::optional<std::vector<std::uint8_t>> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.seekg(0, std::ios::beg);
    if (!data.empty() &&
        !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return std::nullopt;
    }
    return data;
}

bool write_file_bytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

std::filesystem::path make_temp_file(std::string_view prefix) {
#ifdef _WIN32
    wchar_t temp_dir[MAX_PATH + 1];
    DWORD len = GetTempPathW(MAX_PATH + 1, temp_dir);
    if (len == 0 || len > MAX_PATH) {
        throw std::runtime_error("Failed to get temp path");
    }
    std::wstring wprefix = path_from_utf8(prefix).native();
    wchar_t temp_name[MAX_PATH + 1];
    if (GetTempFileNameW(temp_dir, wprefix.c_str(), 0, temp_name) == 0) {
        throw std::runtime_error("Failed to create temp file");
    }
    return std::filesystem::path(temp_name);
#else
    std::string temp_dir = "/tmp";
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        temp_dir = tmpdir;
    }

    std::string tmpl = temp_dir + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    return std::filesystem::path(tmpl_buf.data());
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace reghive::platform
