#include "parser.hpp"
#include "text.hpp"
#include <algorithm>

namespace mwtab {

Parser::Parser(Lexer& lex, std::string source)
    : lexer(lex), currentToken{TokenType::END_OF_FILE, "", "", {}, std::nullopt, 0}
{
    doc.source = std::move(source);
    doc.input_format = Format::MWTAB;
}

Document Parser::parse()
{
    advance();
    while (currentToken.type != TokenType::END_OF_FILE)
    {
        switch (currentToken.type)
        {
        case TokenType::SECTION_START:
            parseSection();
            break;
        case TokenType::END_OF_SECTION:
            advance();
            break;
        default:
            throw BuildError("Content outside of any section at line " + std::to_string(currentToken.line) + ": "
                             + currentToken.to_string());
        }
    }

    relocateResultsFile();

    if (!doc.header())
        throw BuildError("MissingHeaderSection: no \"#METABOLOMICS WORKBENCH\" section in " + doc.source);

    return std::move(doc);
}

void Parser::parseSection()
{
    SectionAccumulator section;
    section.name = currentToken.key;
    consume(TokenType::SECTION_START);

    while (currentToken.type != TokenType::END_OF_SECTION && currentToken.type != TokenType::SECTION_START
           && currentToken.type != TokenType::END_OF_FILE)
    {
        switch (currentToken.type)
        {
        case TokenType::KEY_VALUE:
            addItem(section, currentToken.key, currentToken.value);
            advance();
            break;
        case TokenType::SUBJECT_SAMPLE_FACTOR_ROW:
        {
            auto& row = *currentToken.row;
            section.rows.push_back({row.subject_id, row.sample_id, row.factors, row.extra, {}});
            advance();
            break;
        }
        case TokenType::BLOCK_START:
            parseBlock(section);
            break;
        default:
            consume(TokenType::KEY_VALUE);
        }
    }

    finishSection(section);
}

void Parser::parseBlock(SectionAccumulator& section)
{
    std::string block = currentToken.key.substr(0, currentToken.key.size() - std::string_view("_START").size());
    consume(TokenType::BLOCK_START);

    bool metabolite_data = block.find("METABOLITE_DATA") != std::string::npos && !block.starts_with("EXTENDED");

    Table table;
    std::vector<std::string> columns{std::string(LABEL_COLUMN)};
    size_t line_index = 0;
    size_t width = 0;

    while (currentToken.type == TokenType::KEY_VALUE_LIST)
    {
        auto cells = currentToken.values;
        while (!cells.empty() && cells.back().empty())
            cells.pop_back();

        if (line_index == 0)
        {
            table.header = cells;
            if (cells.size() > 1)
                columns.insert(columns.end(), cells.begin() + 1, cells.end());
        }
        else if (line_index == 1 && metabolite_data && to_lower(currentToken.key) == "factors")
        {
            parseFactorsLine(cells, table.header);
        }
        else
        {
            Row row;
            size_t count = std::max(columns.size(), cells.size());
            for (size_t i = 0; i < count; ++i)
                row.add(i < columns.size() ? columns[i] : "", i < cells.size() ? cells[i] : "");
            if (cells.size() > columns.size())
                doc.add_short_header(block);
            width = std::max(width, row.size());
            table.rows.push_back(std::move(row));
        }

        ++line_index;
        advance();
    }

    std::string end = currentToken.key;
    consume(TokenType::BLOCK_END);

    // Rows longer than the header gained unnamed columns; give every row the same set.
    for (auto& row : table.rows)
        while (row.size() < width)
            row.add("", "");

    if (end.starts_with("METABOLITES"))
        section.metabolites = std::move(table);
    else if (end.starts_with("EXTENDED_"))
        section.extended = std::move(table);
    else
        section.data = std::move(table);
}

void Parser::parseFactorsLine(const std::vector<std::string>& cells, const std::vector<std::string>& header)
{
    Multimap factors;
    for (size_t i = 1; i < cells.size() && i < header.size(); ++i)
    {
        std::vector<std::string> pairs;
        if (!cells[i].empty())
        {
            for (const auto& pair : split(cells[i], "| "))
            {
                auto parts = split_first(pair, ":");
                if (!parts)
                    throw BuildError("Malformed factor \"" + pair + "\" at line " + std::to_string(currentToken.line));
                pairs.push_back(strip(parts->first) + ":" + strip(parts->second));
            }
        }
        factors.add(header[i], join(pairs, " | "));
    }
    doc.data_factors = std::move(factors);
}

void Parser::addItem(SectionAccumulator& section, const std::string& key, const std::string& value)
{
    if (key.ends_with("_RESULTS_FILE"))
    {
        section.items.set_results_file(ResultsFile::parse(key, value));
        return;
    }

    auto* existing = section.items.items.find(key);
    if (!existing)
    {
        section.items.items.add(key, value);
        return;
    }

    if (*existing == value)
        doc.add_duplicate_sub_section(section.name, key);

    if (section.name.ends_with("WORKBENCH"))
        *existing = value;
    else
        *existing += " " + value;
}

void Parser::finishSection(SectionAccumulator& section)
{
    if (section.name == "END")
        return;

    if (section.name == METABOLITES_SECTION)
    {
        mergeMetabolites(section);
        return;
    }

    std::string name = section.name == "NMR" ? "NM" : section.name;

    if (!section.rows.empty() || name == SSF_SECTION)
    {
        if (!section.items.items.empty())
            throw BuildError("The " + name + " section mixes subject/sample/factor rows with key/value lines");
        doc.set(name, ListSection{std::move(section.rows)});
        return;
    }

    if (section.data || section.metabolites || section.extended || is_data_section_name(name))
    {
        DataSection data;
        if (const auto* units = section.items.items.find("Units"))
        {
            data.units = *units;
            section.items.items.erase("Units");
        }
        if (section.items.results_file)
        {
            section.items.items.erase(section.items.results_file->key);
            data.results_file = std::move(section.items.results_file);
        }
        data.data = std::move(section.data);
        data.metabolites = std::move(section.metabolites);
        data.extended = std::move(section.extended);
        data.items = std::move(section.items.items);
        doc.set(name, std::move(data));
        return;
    }

    doc.set(name, std::move(section.items));
}

void Parser::mergeMetabolites(SectionAccumulator& section)
{
    std::string target = doc.data_section_name();
    if (target.empty())
        throw BuildError("The METABOLITES section must follow a METABOLITE_DATA or BINNED_DATA section");

    auto& data = *doc.get<DataSection>(target);
    if (section.data)
        data.data = std::move(section.data);
    if (section.metabolites)
        data.metabolites = std::move(section.metabolites);
    if (section.extended)
        data.extended = std::move(section.extended);
    if (section.items.results_file)
        data.results_file = std::move(section.items.results_file);

    for (const auto& entry : section.items.items)
    {
        if (data.results_file && entry.key == data.results_file->key)
            continue;
        if (entry.key == "Units")
            data.units = entry.value;
        else
            data.items.set(entry.key, entry.value);
    }
}

void Parser::relocateResultsFile()
{
    std::string name = doc.data_section_name();
    if (name.empty())
        return;

    auto& data = *doc.get<DataSection>(name);
    if (!data.results_file)
        return;

    ItemSection* target = doc.get<ItemSection>("MS");
    if (!target)
        target = doc.get<ItemSection>("NM");
    if (!target)
        return;

    target->set_results_file(std::move(*data.results_file));
    data.results_file.reset();
}

Document build(const std::string& source, std::string_view text)
{
    Lexer lexer(text);
    Parser parser(lexer, source);
    return parser.parse();
}

} // namespace mwtab
