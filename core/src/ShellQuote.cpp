#include "sftpovw/ShellQuote.hpp"

#include <cctype>
#include <cstring>

namespace sftpovw {

static bool isShellSafe(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (std::isalnum(u))
        return true;
    return c != '\0' && std::strchr("@%+=:,./-_", c) != nullptr;
}

std::string shellQuote(const std::string& word) {
    if (word.empty())
        return "''";
    bool safe = true;
    for (char c : word) {
        if (!isShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe)
        return word;

    std::string out;
    out.reserve(word.size() + 2);
    out.push_back('\'');
    for (char c : word) {
        if (c == '\'')
            out += "'\"'\"'";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string shellJoin(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty())
            out.push_back(' ');
        out += shellQuote(w);
    }
    return out;
}

bool shellSplit(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::string cur;
    bool inWord = false;
    enum class Quote { None, Single, Double } quote = Quote::None;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        switch (quote) {
        case Quote::Single:
            if (c == '\'')
                quote = Quote::None;
            else
                cur.push_back(c);
            break;
        case Quote::Double:
            if (c == '"') {
                quote = Quote::None;
            } else if (c == '\\' && i + 1 < line.size() &&
                       std::strchr("\"\\$`", line[i + 1]) != nullptr) {
                cur.push_back(line[++i]);
            } else {
                cur.push_back(c);
            }
            break;
        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (inWord) {
                    out.push_back(cur);
                    cur.clear();
                    inWord = false;
                }
            } else if (c == '\'') {
                quote = Quote::Single;
                inWord = true;
            } else if (c == '"') {
                quote = Quote::Double;
                inWord = true;
            } else if (c == '\\') {
                if (i + 1 >= line.size())
                    return false;
                cur.push_back(line[++i]);
                inWord = true;
            } else {
                cur.push_back(c);
                inWord = true;
            }
            break;
        }
    }
    if (quote != Quote::None)
        return false;
    if (inWord)
        out.push_back(cur);
    return true;
}

} // namespace sftpovw
