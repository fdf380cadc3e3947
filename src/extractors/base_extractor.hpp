#pragma once
#include <string>
#include <cstdint>
#include <functional>

#include <filesystem>
namespace fs = std::filesystem;

// Receives decompressed bytes of an archive member, chunk by chunk.
using ChunkSink = std::function<void(const std::uint8_t* data, size_t length)>;

class BaseExtractor {
public:
    virtual ~BaseExtractor() = default;
    virtual std::string name() const = 0;
    virtual bool match(const fs::path& path) const = 0;
    // Streams the first member, in the container's declared order, into sink.
    // Throws ArchiveOpenError, EmptyArchiveError or EntryOpenError.
    virtual void extractFirst(const fs::path& path, const ChunkSink& sink) = 0;
};
