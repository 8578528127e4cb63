#include "lexer.hpp"
#include "document.hpp"
#include "errors.hpp"
#include "text.hpp"

namespace mwtab {

std::string_view to_string(TokenType type) {
    switch (type) {
    case TokenType::SECTION_START: return "SECTION_START";
    case TokenType::END_OF_SECTION: return "END_OF_SECTION";
    case TokenType::KEY_VALUE: return "KEY_VALUE";
    case TokenType::KEY_VALUE_LIST: return "KEY_VALUE_LIST";
    case TokenType::SUBJECT_SAMPLE_FACTOR_ROW: return "SUBJECT_SAMPLE_FACTOR_ROW";
    case TokenType::BLOCK_START: return "BLOCK_START";
    case TokenType::BLOCK_END: return "BLOCK_END";
    case TokenType::END_OF_FILE: return "END_OF_FILE";
    }
    return "UNKNOWN";
}

std::string Token::to_string() const {
    std::string text = std::string(mwtab::to_string(type)) + "(" + key;
    if (!value.empty()) text += ", " + value;
    if (!values.empty()) text += ", [" + join(values, ", ") + "]";
    return text + ")";
}

Token Lexer::next() {
    while (pending.empty()) {
        if (finished) {
            return {TokenType::END_OF_FILE, "", "", {}, std::nullopt, line_number};
        }
        auto line = next_line();
        if (!line) {
            if (in_block) {
                throw TokenizeError(line_number, "", "end of text inside a data block");
            }
            emit(TokenType::END_OF_SECTION);
            emit(TokenType::END_OF_FILE);
            finished = true;
            break;
        }
        if (line->empty()) continue;

        if (in_block) scan_block_line(*line);
        else scan_line(*line);
    }
    Token token = std::move(pending.front());
    pending.pop_front();
    return token;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().type == TokenType::END_OF_FILE) break;
    }
    return tokens;
}

std::optional<std::string_view> Lexer::next_line() {
    if (is_eof()) return std::nullopt;

    size_t end = source.find('\n', cursor);
    if (end == std::string_view::npos) end = source.length();
    std::string_view line = source.substr(cursor, end - cursor);
    cursor = end + 1;
    line_number++;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

void Lexer::emit(TokenType type, std::string key, std::string value) {
    pending.push_back({type, std::move(key), std::move(value), {}, std::nullopt, line_number});
}

void Lexer::scan_line(std::string_view line) {
    if (line.starts_with("#METABOLOMICS WORKBENCH")) {
        scan_header(line);
    } else if (line.starts_with("#SUBJECT_SAMPLE_FACTORS:")) {
        emit(TokenType::END_OF_SECTION);
        emit(TokenType::SECTION_START, std::string(SSF_SECTION));
    } else if (line.starts_with("#")) {
        emit(TokenType::END_OF_SECTION);
        emit(TokenType::SECTION_START, strip(line.substr(1)));
    } else if (line.starts_with(SSF_SECTION)) {
        scan_factor_row(line);
    } else {
        std::string first = strip(line.substr(0, line.find('\t')));
        if (first.ends_with("_START")) {
            emit(TokenType::BLOCK_START, first);
            in_block = true;
        } else {
            scan_item(line);
        }
    }
}

void Lexer::scan_block_line(std::string_view line) {
    auto cells = split(line, "\t");
    for (auto& cell : cells) {
        cell = strip(cell, "\" ");
    }
    if (cells.front().ends_with("_END")) {
        emit(TokenType::BLOCK_END, cells.front());
        in_block = false;
        return;
    }
    Token token{TokenType::KEY_VALUE_LIST, cells.front(), "", std::move(cells), std::nullopt, line_number};
    pending.push_back(std::move(token));
}

void Lexer::scan_header(std::string_view line) {
    emit(TokenType::SECTION_START, std::string(HEADER_SECTION));
    for (const auto& word : split_whitespace(line)) {
        if (auto pair = split_first(word, ":")) {
            emit(TokenType::KEY_VALUE, pair->first, pair->second);
        }
    }
}

void Lexer::scan_factor_row(std::string_view line) {
    auto fields = split(line, "\t");
    if (fields.size() < 4) {
        throw TokenizeError(line_number, std::string(line), "expected subject, sample and factors fields");
    }

    FactorRow row;
    row.subject_id = fields[1];
    row.sample_id = fields[2];

    if (!fields[3].empty()) {
        for (const auto& pair : split(fields[3], " | ")) {
            auto parts = split_first(pair, ":");
            if (!parts) {
                throw TokenizeError(line_number, std::string(line), "MalformedRow: factor \"" + pair + "\" has no ':'");
            }
            row.factors.add(strip(parts->first), strip(parts->second));
        }
    }

    if (fields.size() > 4 && !fields[4].empty()) {
        Multimap extra;
        for (const auto& pair : split(fields[4], "; ")) {
            auto parts = split_first(pair, "=");
            if (!parts) {
                throw TokenizeError(line_number, std::string(line), "MalformedRow: additional sample data \"" + pair + "\" has no '='");
            }
            extra.add(strip(parts->first), strip(parts->second));
        }
        row.extra = std::move(extra);
    }

    Token token{TokenType::SUBJECT_SAMPLE_FACTOR_ROW, std::string(SSF_SECTION), "", {}, std::move(row), line_number};
    pending.push_back(std::move(token));
}

void Lexer::scan_item(std::string_view line) {
    if (line.find("_RESULTS_FILE") != std::string_view::npos) {
        auto fields = split(line, "\t");
        std::string key = strip(fields.front());
        key = key.size() > 3 ? key.substr(3) : "";
        fields.erase(fields.begin());
        emit(TokenType::KEY_VALUE, key, join(fields, "\t"));
        return;
    }

    auto pair = split_first(line, "\t");
    if (!pair) {
        throw TokenizeError(line_number, std::string(line), "expected a tab between key and value");
    }
    auto& [key, value] = *pair;
    if (key.find(':') != std::string::npos) {
        if (key.find(":UNITS") != std::string::npos) {
            emit(TokenType::KEY_VALUE, "Units", value);
        } else {
            std::string stripped = strip(key);
            emit(TokenType::KEY_VALUE, stripped.size() > 3 ? stripped.substr(3) : "", value);
        }
    } else {
        emit(TokenType::KEY_VALUE, strip(key), strip(value));
    }
}

} // namespace mwtab
