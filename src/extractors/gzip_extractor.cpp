#include "base_extractor.hpp"
#include "extractor_registry.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <zlib.h>
#include <filesystem>
#include <fstream>
#include <vector>
#include <string>

namespace fs = std::filesystem;

// A gzip file holds exactly one member: its decompressed stream.
class GZIPExtractor : public BaseExtractor {
public:
    std::string name() const override { return "GZIP"; }

    bool match(const fs::path& path) const override {
        return lower_extension(path) == ".gz";
    }

    void extractFirst(const fs::path& path, const ChunkSink& sink) override
    {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw ArchiveOpenError("Cannot open gzip file " + path.string());
        }

        std::vector<uint8_t> in(16384);
        file.read(reinterpret_cast<char*>(in.data()), in.size());
        size_t got = static_cast<size_t>(file.gcount());
        if (got == 0) {
            throw EmptyArchiveError("Gzip file " + path.string() + " is empty");
        }
        if (got < 2 || in[0] != 0x1F || in[1] != 0x8B) {
            throw ArchiveOpenError("Not a gzip stream: " + path.string());
        }

        // 16+MAX_WBITS tells zlib to expect GZIP header
        z_stream strm{};
        if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
            throw ArchiveOpenError("GZIP inflateInit2 failed for " + path.string());
        }

        std::vector<uint8_t> buffer(16384);
        int ret = Z_OK;
        try {
            while (true) {
                strm.next_in = in.data();
                strm.avail_in = static_cast<uInt>(got);

                do {
                    strm.next_out = buffer.data();
                    strm.avail_out = static_cast<uInt>(buffer.size());

                    ret = inflate(&strm, Z_NO_FLUSH);
                    if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                        throw EntryOpenError("GZIP inflate error in " + path.string() +
                                             (strm.msg ? std::string(": ") + strm.msg : std::string()));
                    }

                    size_t have = buffer.size() - strm.avail_out;
                    if (have > 0)
                        sink(buffer.data(), have);
                } while (strm.avail_out == 0 && ret != Z_STREAM_END);

                if (ret == Z_STREAM_END)
                    break;

                if (!file.eof()) {
                    file.read(reinterpret_cast<char*>(in.data()), in.size());
                    got = static_cast<size_t>(file.gcount());
                } else {
                    got = 0;
                }
                if (got == 0) {
                    throw EntryOpenError("Truncated gzip stream: " + path.string());
                }
            }
        } catch (...) {
            inflateEnd(&strm);
            throw;
        }

        inflateEnd(&strm);
        Logger::debug("GZIP member decoded from " + path.string());
    }
};

REGISTER_EXTRACTOR(GZIPExtractor)
