#include "base_extractor.hpp"
#include "extractor_registry.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <lzma.h>  // Requires liblzma (xz-utils)
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <string>

namespace fs = std::filesystem;

class XZExtractor : public BaseExtractor {
public:
std::string name() const override { return "XZ"; };

bool match(const fs::path& path) const override {
    return lower_extension(path) == ".xz";
}

void extractFirst(const fs::path& path, const ChunkSink& sink) override {
    static const std::array<uint8_t, 6> magic = {0xFD, '7', 'z', 'X', 'Z', 0x00};

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ArchiveOpenError("Cannot open xz file " + path.string());
    }

    std::vector<uint8_t> in(1 << 16);
    file.read(reinterpret_cast<char*>(in.data()), in.size());
    size_t got = static_cast<size_t>(file.gcount());
    if (got == 0) {
        throw EmptyArchiveError("XZ file " + path.string() + " is empty");
    }
    if (got < magic.size() || std::memcmp(in.data(), magic.data(), magic.size()) != 0) {
        throw ArchiveOpenError("Not an xz stream: " + path.string());
    }

    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_stream_decoder(&strm, UINT64_MAX, 0);
    if (ret != LZMA_OK) {
        throw ArchiveOpenError("Failed to init xz decoder for " + path.string());
    }

    std::vector<uint8_t> buf(1 << 16); // 64 KiB buffer
    strm.next_in = in.data();
    strm.avail_in = got;
    lzma_action action = LZMA_RUN;

    try {
        while (true) {
            if (strm.avail_in == 0 && action == LZMA_RUN) {
                file.read(reinterpret_cast<char*>(in.data()), in.size());
                got = static_cast<size_t>(file.gcount());
                strm.next_in = in.data();
                strm.avail_in = got;
                if (got == 0)
                    action = LZMA_FINISH;
            }

            strm.next_out = buf.data();
            strm.avail_out = buf.size();

            ret = lzma_code(&strm, action);

            size_t produced = buf.size() - strm.avail_out;
            if (produced > 0)
                sink(buf.data(), produced);

            if (ret == LZMA_STREAM_END)
                break;
            if (ret != LZMA_OK) {
                throw EntryOpenError("XZ decompression error " + std::to_string(ret) +
                                     " in " + path.string());
            }
        }
    } catch (...) {
        lzma_end(&strm);
        throw;
    }

    lzma_end(&strm);
    Logger::debug("XZ member decoded from " + path.string());
}

};

REGISTER_EXTRACTOR(XZExtractor)
