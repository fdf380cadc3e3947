#include "dat_tokenizer.hpp"
#include <cctype>

namespace {
bool isDelimiter(uint8_t c) {
    return std::isspace(c) || c == '(' || c == ')';
}
}

DatTokenizer::DatTokenizer(const std::vector<uint8_t>& blob) : blob(blob) {}

DatToken DatTokenizer::next() {
    if (!pending.empty()) {
        DatToken tok = pending.front();
        pending.pop_front();
        return tok;
    }
    return scan();
}

const DatToken& DatTokenizer::peek() {
    if (pending.empty()) {
        pending.push_back(scan());
    }
    return pending.front();
}

void DatTokenizer::pushBack(const DatToken& tok) {
    pending.push_front(tok);
}

bool DatTokenizer::closingQuoteOnLine(size_t from) const {
    for (size_t i = from; i < blob.size(); ++i) {
        if (blob[i] == '"') return true;
        if (blob[i] == '\n') return false;
    }
    return false;
}

DatToken DatTokenizer::scan() {
    while (pos < blob.size() && std::isspace(blob[pos])) {
        if (blob[pos] == '\n') ++currentLine;
        ++pos;
    }

    DatToken tok;
    tok.line = currentLine;
    if (pos >= blob.size()) {
        tok.kind = DatTokenKind::End;
        return tok;
    }

    uint8_t c = blob[pos];
    if (c == '(') {
        ++pos;
        tok.kind = DatTokenKind::Open;
        tok.text = "(";
        return tok;
    }
    if (c == ')') {
        ++pos;
        tok.kind = DatTokenKind::Close;
        tok.text = ")";
        return tok;
    }

    if (c == '"' && closingQuoteOnLine(pos + 1)) {
        size_t start = ++pos;
        while (blob[pos] != '"') ++pos;
        tok.kind = DatTokenKind::Quoted;
        tok.text.assign(blob.begin() + start, blob.begin() + pos);
        ++pos;
        return tok;
    }

    size_t start = pos;
    ++pos;
    while (pos < blob.size() && !isDelimiter(blob[pos])) ++pos;
    tok.kind = DatTokenKind::Word;
    tok.text.assign(blob.begin() + start, blob.begin() + pos);
    return tok;
}

const DatClause* DatClause::find(const std::string& childKey) const {
    for (const auto& child : children) {
        if (child.key == childKey)
            return &child;
    }
    return nullptr;
}
