#include<iostream>
#include "printer.hpp"
#include "catalog_builder.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>

namespace {
cJSON* build_json_record(const GameRecord& r) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "name", r.name.c_str());
    cJSON_AddStringToObject(item, "filename", r.filename.c_str());
    cJSON_AddStringToObject(item, "platform", r.platform.c_str());
    cJSON_AddStringToObject(item, "hash", r.hash.c_str());
    return item;
}
}

std::string recordsToJson(const std::vector<GameRecord>& records) {
    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> root(cJSON_CreateArray(), &cJSON_Delete);
    for (const auto& r : records) {
        cJSON_AddItemToArray(root.get(), build_json_record(r));
    }
    char* jsonStr = cJSON_Print(root.get());
    if (!jsonStr) {
        throw std::runtime_error("cJSON_Print failed");
    }
    std::string text(jsonStr);
    free(jsonStr);
    return text;
}

void dumpJson(const std::vector<GameRecord>& records, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        throw IOError("Cannot write JSON output " + filename);
    }
    std::string text = recordsToJson(records);
    outFile.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!outFile) {
        throw IOError("Write failure on " + filename);
    }
    Logger::info("Wrote " + std::to_string(records.size()) + " records to " + filename);
}

void printHash(const std::string& hash, const std::string& inputFile) {
    std::cout << hash << "  " << inputFile << "\n";
}

void printLookup(const std::optional<GameRecord>& record, const std::string& query) {
    std::cout << "* " << query << "\n";
    if (!record) {
        std::cout << "└── " << ansi::red << "no match" << ansi::reset << "\n";
        return;
    }
    std::cout << "├── " << ansi::bold << ansi::yellow << record->name << ansi::reset << "\n";
    std::cout << "├── Platform: " << ansi::cyan << record->platform << ansi::reset << "\n";
    if (!record->filename.empty())
        std::cout << "├── Filename: " << ansi::magenta << record->filename << ansi::reset << "\n";
    std::cout << "└── SHA1: " << ansi::gray << (record->hash.empty() ? "-" : record->hash)
              << ansi::reset << "\n";
}

void printBuildSummary(const BuildSummary& summary) {
    std::cout << ansi::bold << "Signature files: " << ansi::reset << summary.filesSeen;
    if (summary.filesFailed)
        std::cout << " (" << ansi::red << summary.filesFailed << " skipped" << ansi::reset << ")";
    std::cout << "\n";
    for (auto it = summary.perPlatform.begin(); it != summary.perPlatform.end(); ++it) {
        bool last = std::next(it) == summary.perPlatform.end();
        std::cout << (last ? "└── " : "├── ") << ansi::cyan << it->first << ansi::reset
                  << " (" << ansi::green << it->second << ansi::reset << ")\n";
    }
    std::cout << ansi::bold << "Records: " << ansi::reset << summary.recordsUnique
              << ", inserted: " << ansi::green << summary.rowsInserted << ansi::reset << "\n";
}
