#pragma once
#include "document.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include <string>
#include <string_view>

namespace mwtab {

// Contents of the section currently being read, finalized on END_OF_SECTION.
struct SectionAccumulator
{
    std::string name;
    ItemSection items;
    std::vector<SubjectSampleFactor> rows;
    std::optional<Table> data;
    std::optional<Table> metabolites;
    std::optional<Table> extended;
};

/**
 * Single-pass builder from the token stream to a Document.
 *
 * Applies the structural rules of the text form: "#NMR" is stored as "NM",
 * "#METABOLITES" merges into the data section read before it, "#END" is
 * dropped, repeated keys are joined (or replaced in the header) and the first
 * line of every data block is taken as that table's header.
 */
class Parser
{
    Lexer& lexer;
    Token currentToken;
    Document doc;

    inline void advance() { currentToken = lexer.next(); }

    inline void consume(TokenType type)
    {
        if (currentToken.type != type)
            throw BuildError("Unexpected token at line " + std::to_string(currentToken.line) + ": " + currentToken.to_string()
                             + ", expected " + std::string(to_string(type)));
        advance();
    }

public:
    Parser(Lexer& lex, std::string source);

    Document parse();

private:
    void parseSection();
    void parseBlock(SectionAccumulator& section);
    void parseFactorsLine(const std::vector<std::string>& cells, const std::vector<std::string>& header);
    void addItem(SectionAccumulator& section, const std::string& key, const std::string& value);
    void finishSection(SectionAccumulator& section);
    void mergeMetabolites(SectionAccumulator& section);
    void relocateResultsFile();
};

// Tokenizes and builds one document from mwTab text.
Document build(const std::string& source, std::string_view text);

} // namespace mwtab
