#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

enum class DatTokenKind {
    Open,
    Close,
    Quoted,
    Word,
    End
};

struct DatToken {
    DatTokenKind kind = DatTokenKind::End;
    std::string text;
    size_t line = 1;
};

// Splits clrmamepro-style DAT text into '(' ')' "quoted" and bare tokens.
// A '"' only opens a quoted string when a closing '"' follows on the same
// line; otherwise it is the first character of a bare word.
class DatTokenizer {
public:
    explicit DatTokenizer(const std::vector<uint8_t>& blob);

    DatToken next();
    const DatToken& peek();
    // Makes tok the next token returned, ahead of anything peeked.
    void pushBack(const DatToken& tok);

    size_t line() const { return currentLine; }

private:
    DatToken scan();
    bool closingQuoteOnLine(size_t from) const;

    const std::vector<uint8_t>& blob;
    size_t pos = 0;
    size_t currentLine = 1;
    std::deque<DatToken> pending;
};

// One "key value" or "key ( ... )" clause of a DAT file.
struct DatClause {
    std::string key;
    std::string value;
    bool quoted = false;
    bool isList = false;
    size_t line = 0;
    std::vector<DatClause> children;

    const DatClause* find(const std::string& childKey) const;
};
