#pragma once
#include "gamerecord.hpp"
#include <optional>
#include <string>
#include <vector>

struct BuildSummary;

void printHash(const std::string& hash, const std::string& inputFile);
void printLookup(const std::optional<GameRecord>& record, const std::string& query);
void printBuildSummary(const BuildSummary& summary);
std::string recordsToJson(const std::vector<GameRecord>& records);
// Throws IOError when filename cannot be written.
void dumpJson(const std::vector<GameRecord>& records, const std::string& filename);
