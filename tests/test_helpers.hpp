#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <unistd.h>

#include <fcntl.h>
#include <sys/stat.h>

namespace copysort::testing {

// Уникальный временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
              / ("copysort_test_" + std::to_string(::getpid()) + "_"
                 + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Полдень локального времени, чтобы дата не зависела от часового пояса
inline auto local_noon(int year, int month, int day) -> std::timespec {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::timespec{std::mktime(&tm), 0};
}

inline void set_mtime(const std::filesystem::path& path, const std::timespec& ts) {
    const std::timespec times[2] = {ts, ts};
    ::utimensat(AT_FDCWD, path.c_str(), times, 0);
}

inline auto mtime_of(const std::filesystem::path& path) -> std::timespec {
    struct stat sb{};
    ::stat(path.c_str(), &sb);
    return sb.st_mtim;
}

inline auto atime_of(const std::filesystem::path& path) -> std::timespec {
    struct stat sb{};
    ::stat(path.c_str(), &sb);
    return sb.st_atim;
}

// Минимальный JPEG: SOI, APP1 с EXIF (только DateTimeOriginal), EOI
inline auto make_exif_jpeg(const std::string& datetime) -> std::string {
    std::string tiff;
    auto u16 = [&tiff](unsigned v) {
        tiff.push_back(static_cast<char>(v & 0xFF));
        tiff.push_back(static_cast<char>((v >> 8) & 0xFF));
    };
    auto u32 = [&](unsigned v) { u16(v & 0xFFFF); u16(v >> 16); };

    tiff += "II";
    u16(0x2A); u32(8);                       // заголовок, IFD0 по смещению 8
    u16(1);                                  // IFD0: одна запись
    u16(0x8769); u16(4); u32(1); u32(26);    // ExifIFD -> 26
    u32(0);
    u16(1);                                  // ExifIFD: одна запись
    u16(0x9003); u16(2); u32(20); u32(44);   // DateTimeOriginal -> 44
    u32(0);
    std::string value = datetime;
    value.resize(19, ' ');
    tiff += value;
    tiff.push_back('\0');

    const std::string payload = std::string("Exif\0\0", 6) + tiff;
    const auto length = static_cast<unsigned>(payload.size() + 2);

    std::string jpeg = "\xFF\xD8\xFF\xE1";
    jpeg.push_back(static_cast<char>((length >> 8) & 0xFF));
    jpeg.push_back(static_cast<char>(length & 0xFF));
    jpeg += payload;
    jpeg += "\xFF\xD9";
    return jpeg;
}

} // namespace copysort::testing
