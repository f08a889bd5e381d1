#pragma once
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace sdrop {
class FileSource {
  public:
    virtual auto get_name() const -> std::string_view      = 0;
    virtual auto get_size() const -> uint64_t              = 0;
    virtual auto get_mime_type() const -> std::string_view = 0;
    // fills out with the bytes at offset
    virtual auto read(uint64_t offset, std::span<std::byte> out) -> bool = 0;

    virtual ~FileSource() {}
};

class MemoryFileSource : public FileSource {
  private:
    std::string            name;
    std::string            mime_type;
    std::vector<std::byte> content;

  public:
    auto get_name() const -> std::string_view override;
    auto get_size() const -> uint64_t override;
    auto get_mime_type() const -> std::string_view override;
    auto read(uint64_t offset, std::span<std::byte> out) -> bool override;

    // mime type is guessed from the name if empty
    MemoryFileSource(std::string name, std::vector<std::byte> content, std::string mime_type = {});
};

// reads lazily, the file must not change while it is sent
class DiskFileSource : public FileSource {
  private:
    std::string   name;
    std::string   mime_type;
    uint64_t      size;
    std::mutex    lock;
    std::ifstream file;

    DiskFileSource() = default;

  public:
    auto get_name() const -> std::string_view override;
    auto get_size() const -> uint64_t override;
    auto get_mime_type() const -> std::string_view override;
    auto read(uint64_t offset, std::span<std::byte> out) -> bool override;

    static auto open(const std::filesystem::path& path) -> std::unique_ptr<DiskFileSource>;
};

// by extension, application/octet-stream if unknown
auto guess_mime_type(std::string_view name) -> std::string_view;

// "0 Bytes", "1.5 KB", "39.06 MB"
auto format_size(uint64_t bytes) -> std::string;
} // namespace sdrop
