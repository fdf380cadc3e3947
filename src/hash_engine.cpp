#include "hash_engine.hpp"
#include "extractor_registry.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "sha1_digest.hpp"
#include <fstream>
#include <system_error>
#include <vector>

HashEngine::HashEngine() {
    extractors = ExtractorRegistry::instance().createAll();
}

BaseExtractor* HashEngine::findExtractor(const fs::path& filePath) const {
    for (const auto& extractor : extractors) {
        if (extractor->match(filePath))
            return extractor.get();
    }
    return nullptr;
}

std::string HashEngine::archiveType(const fs::path& filePath) const {
    BaseExtractor* extractor = findExtractor(filePath);
    return extractor ? extractor->name() : std::string();
}

std::string HashEngine::fingerprint(const fs::path& filePath) {
    Logger::debug("HashEngine::fingerprint " + filePath.string());

    BaseExtractor* extractor = findExtractor(filePath);
    if (!extractor) {
        return hashPlainFile(filePath);
    }

    Logger::debug("Using " + extractor->name() + " extractor");
    Sha1Digest digest;
    extractor->extractFirst(filePath, [&digest](const std::uint8_t* data, size_t length) {
        digest.update(data, length);
    });
    return digest.finalHex();
}

std::string HashEngine::hashPlainFile(const fs::path& filePath) {
    std::error_code ec;
    fs::file_status status = fs::status(filePath, ec);
    if (ec) {
        throw IOError("Cannot open file " + filePath.string() + ": " + ec.message());
    }
    if (fs::is_directory(status)) {
        throw IOError("Not a regular file: " + filePath.string());
    }
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file " + filePath.string());
    }

    Sha1Digest digest;
    std::vector<char> buffer(1 << 16);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize n = file.gcount();
        if (n > 0)
            digest.update(reinterpret_cast<const std::uint8_t*>(buffer.data()), static_cast<size_t>(n));
    }
    if (file.bad()) {
        throw IOError("Read failure on " + filePath.string());
    }
    return digest.finalHex();
}
