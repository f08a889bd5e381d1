#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <utility>

#include "file-source.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_file");
}

namespace sdrop {
namespace {
const auto mime_types = std::array{
    std::pair{"txt", "text/plain"},
    std::pair{"html", "text/html"},
    std::pair{"htm", "text/html"},
    std::pair{"css", "text/css"},
    std::pair{"csv", "text/csv"},
    std::pair{"md", "text/markdown"},
    std::pair{"js", "text/javascript"},
    std::pair{"json", "application/json"},
    std::pair{"xml", "application/xml"},
    std::pair{"pdf", "application/pdf"},
    std::pair{"zip", "application/zip"},
    std::pair{"gz", "application/gzip"},
    std::pair{"tar", "application/x-tar"},
    std::pair{"7z", "application/x-7z-compressed"},
    std::pair{"doc", "application/msword"},
    std::pair{"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    std::pair{"xls", "application/vnd.ms-excel"},
    std::pair{"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    std::pair{"ppt", "application/vnd.ms-powerpoint"},
    std::pair{"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    std::pair{"png", "image/png"},
    std::pair{"jpg", "image/jpeg"},
    std::pair{"jpeg", "image/jpeg"},
    std::pair{"gif", "image/gif"},
    std::pair{"webp", "image/webp"},
    std::pair{"svg", "image/svg+xml"},
    std::pair{"bmp", "image/bmp"},
    std::pair{"mp3", "audio/mpeg"},
    std::pair{"wav", "audio/wav"},
    std::pair{"ogg", "audio/ogg"},
    std::pair{"flac", "audio/flac"},
    std::pair{"mp4", "video/mp4"},
    std::pair{"webm", "video/webm"},
    std::pair{"mkv", "video/x-matroska"},
    std::pair{"mov", "video/quicktime"},
};

const auto size_units = std::array{"Bytes", "KB", "MB", "GB"};
} // namespace

auto MemoryFileSource::get_name() const -> std::string_view {
    return name;
}

auto MemoryFileSource::get_size() const -> uint64_t {
    return content.size();
}

auto MemoryFileSource::get_mime_type() const -> std::string_view {
    return mime_type;
}

auto MemoryFileSource::read(const uint64_t offset, const std::span<std::byte> out) -> bool {
    ensure(offset <= content.size() && out.size() <= content.size() - offset, "read beyond end offset={} size={}", offset, out.size());
    std::memcpy(out.data(), content.data() + offset, out.size());
    return true;
}

MemoryFileSource::MemoryFileSource(std::string name, std::vector<std::byte> content, std::string mime_type)
    : name(std::move(name)),
      mime_type(std::move(mime_type)),
      content(std::move(content)) {
    if(this->mime_type.empty()) {
        this->mime_type = guess_mime_type(this->name);
    }
}

auto DiskFileSource::get_name() const -> std::string_view {
    return name;
}

auto DiskFileSource::get_size() const -> uint64_t {
    return size;
}

auto DiskFileSource::get_mime_type() const -> std::string_view {
    return mime_type;
}

auto DiskFileSource::read(const uint64_t offset, const std::span<std::byte> out) -> bool {
    auto guard = std::lock_guard(lock);
    ensure(offset <= size && out.size() <= size - offset, "read beyond end of {}", name);
    file.clear();
    ensure(file.seekg(std::streamoff(offset)), "seek failed in {}", name);
    ensure(file.read((char*)out.data(), std::streamsize(out.size())), "read failed in {}", name);
    return true;
}

auto DiskFileSource::open(const std::filesystem::path& path) -> std::unique_ptr<DiskFileSource> {
    auto ec   = std::error_code();
    auto size = std::filesystem::file_size(path, ec);
    ensure(!ec, "cannot stat {}: {}", path.string(), ec.message());

    auto source = std::unique_ptr<DiskFileSource>(new DiskFileSource());
    source->file.open(path, std::ios::binary);
    ensure(source->file, "cannot open {}", path.string());
    source->name      = path.filename().string();
    source->mime_type = guess_mime_type(source->name);
    source->size      = size;
    return source;
}

auto guess_mime_type(const std::string_view name) -> std::string_view {
    const auto dot = name.rfind('.');
    if(dot == std::string_view::npos) {
        return "application/octet-stream";
    }
    auto ext = std::string(name.substr(dot + 1));
    std::ranges::transform(ext, ext.begin(), [](const char c) { return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c; });
    for(const auto& [key, type] : mime_types) {
        if(ext == key) {
            return type;
        }
    }
    return "application/octet-stream";
}

auto format_size(const uint64_t bytes) -> std::string {
    if(bytes == 0) {
        return "0 Bytes";
    }
    auto unit  = size_t(0);
    auto value = double(bytes);
    while(value >= 1024 && unit + 1 < size_units.size()) {
        value /= 1024;
        unit += 1;
    }
    auto str = std::format("{:.2f}", value);
    // 1.50 -> 1.5, 2.00 -> 2
    while(str.back() == '0') {
        str.pop_back();
    }
    if(str.back() == '.') {
        str.pop_back();
    }
    return std::format("{} {}", str, size_units[unit]);
}
} // namespace sdrop
