#include "base_extractor.hpp"
#include "extractor_registry.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <zip.h>
#include <memory>
#include <vector>
#include <string>

namespace fs = std::filesystem;

class ZIPExtractor : public BaseExtractor {
public:
std::string name() const override { return "ZIP"; };

bool match(const fs::path& path) const override {
    return lower_extension(path) == ".zip";
}

void extractFirst(const fs::path& path, const ChunkSink& sink) override {
    int errorCode = 0;
    zip_t* raw = zip_open(path.string().c_str(), ZIP_RDONLY, &errorCode);
    if (!raw) {
        zip_error_t error;
        zip_error_init_with_code(&error, errorCode);
        std::string reason = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw ArchiveOpenError("Failed to open zip archive " + path.string() + ": " + reason);
    }
    std::unique_ptr<zip_t, decltype(&zip_discard)> archive(raw, &zip_discard);

    zip_int64_t numEntries = zip_get_num_entries(archive.get(), 0);
    if (numEntries <= 0) {
        throw EmptyArchiveError("Zip archive " + path.string() + " is empty");
    }

    // Index 0 is the first member of the central directory, no sorting.
    const char* entryName = zip_get_name(archive.get(), 0, 0);
    std::string member = entryName ? entryName : "#0";
    Logger::debug("ZIP first entry: " + member);

    zip_file_t* rawFile = zip_fopen_index(archive.get(), 0, 0);
    if (!rawFile) {
        throw EntryOpenError("Failed to open " + member + " within " + path.string() +
                             ": " + zip_strerror(archive.get()));
    }
    std::unique_ptr<zip_file_t, decltype(&zip_fclose)> file(rawFile, &zip_fclose);

    std::vector<uint8_t> buffer(1 << 16);
    while (true) {
        zip_int64_t n = zip_fread(file.get(), buffer.data(), buffer.size());
        if (n < 0) {
            throw EntryOpenError("Failed to decompress " + member + " within " + path.string() +
                                 ": " + zip_file_strerror(file.get()));
        }
        if (n == 0)
            break;
        sink(buffer.data(), static_cast<size_t>(n));
    }
}

};

REGISTER_EXTRACTOR(ZIPExtractor)
