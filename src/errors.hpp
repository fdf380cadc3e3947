#pragma once
#include <stdexcept>
#include <string>

// Root of every error raised by romdig.
class RomdigError : public std::runtime_error {
public:
    explicit RomdigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Open or read failure on a plain file.
class IOError : public RomdigError {
public:
    explicit IOError(const std::string& message) : RomdigError(message) {}
};

class ArchiveError : public RomdigError {
public:
    explicit ArchiveError(const std::string& message) : RomdigError(message) {}
};

class ArchiveOpenError : public ArchiveError {
public:
    explicit ArchiveOpenError(const std::string& message) : ArchiveError(message) {}
};

class EmptyArchiveError : public ArchiveError {
public:
    explicit EmptyArchiveError(const std::string& message) : ArchiveError(message) {}
};

// The first member exists but could not be opened or decompressed.
class EntryOpenError : public ArchiveError {
public:
    explicit EntryOpenError(const std::string& message) : ArchiveError(message) {}
};

// Malformed signature file or block. Never fatal to a build run.
class ParseError : public RomdigError {
public:
    explicit ParseError(const std::string& message) : RomdigError(message) {}
};

class StoreError : public RomdigError {
public:
    explicit StoreError(const std::string& message) : RomdigError(message) {}
};

class StoreUninitializedError : public StoreError {
public:
    StoreUninitializedError()
        : StoreError("catalog store is not initialized") {}
};

// A bulk insert failed and was rolled back.
class PersistenceError : public StoreError {
public:
    explicit PersistenceError(const std::string& message) : StoreError(message) {}
};

class UsageError : public RomdigError {
public:
    explicit UsageError(const std::string& message) : RomdigError(message) {}
};
