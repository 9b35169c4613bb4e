#include "sftpovw/SshConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>
#include <vector>

namespace sftpovw {

static bool globMatch(const char* pat, const char* s) {
    for (; *pat; ++pat, ++s) {
        if (*pat == '*') {
            while (*pat == '*')
                ++pat;
            if (!*pat)
                return true;
            for (; *s; ++s) {
                if (globMatch(pat, s))
                    return true;
            }
            return false;
        }
        if (!*s)
            return false;
        if (*pat != '?' &&
            std::tolower(static_cast<unsigned char>(*pat)) !=
                std::tolower(static_cast<unsigned char>(*s)))
            return false;
    }
    return *s == '\0';
}

bool sshHostMatches(const std::string& patterns, const std::string& host) {
    std::istringstream in(patterns);
    std::string pat;
    bool matched = false;
    while (in >> pat) {
        const bool negated = !pat.empty() && pat.front() == '!';
        if (negated)
            pat.erase(0, 1);
        if (globMatch(pat.c_str(), host.c_str())) {
            if (negated)
                return false;
            matched = true;
        }
    }
    return matched;
}

std::string expandUserPath(const std::string& path) {
    if (path.empty() || path.front() != '~')
        return path;
    if (path.size() > 1 && path[1] != '/')
        return path; // ~usuario no se expande
    const char* home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    return std::string(home) + path.substr(1);
}

static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// "Clave Valor", "Clave=Valor" o "Clave = Valor"; se quitan las comillas del valor.
static bool splitDirective(const std::string& line, std::string& key,
                           std::string& value) {
    std::size_t i = 0;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])) &&
           line[i] != '=')
        ++i;
    key = line.substr(0, i);
    for (char& c : key)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
        ++i;
    if (i < line.size() && line[i] == '=')
        ++i;
    value = trim(line.substr(i));
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        value = value.substr(1, value.size() - 2);
    return !key.empty();
}

bool parseSshConfig(std::istream& in, const std::string& host,
                    SshHostConfig& out, std::string& err) {
    out = SshHostConfig{};
    std::optional<std::string> hostName;
    bool active = true; // las directivas antes del primer Host aplican a todos
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = trim(raw);
        if (line.empty() || line.front() == '#')
            continue;
        std::string key, value;
        if (!splitDirective(line, key, value))
            continue;

        if (key == "host") {
            active = sshHostMatches(value, host);
            continue;
        }
        if (key == "match") {
            active = false;
            continue;
        }
        if (!active)
            continue;

        if (key == "hostname" && !hostName) {
            hostName = value;
        } else if (key == "user" && !out.user) {
            out.user = value;
        } else if (key == "identityfile" && !out.identityFile) {
            out.identityFile = expandUserPath(value);
        } else if (key == "port" && !out.port) {
            char* end = nullptr;
            const long p = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || p < 1 || p > 65535) {
                err = "invalid Port '" + value + "' at line " + std::to_string(lineNo);
                return false;
            }
            out.port = static_cast<std::uint16_t>(p);
        }
    }
    out.hostName = hostName.value_or(host);
    return true;
}

bool lookupSshConfig(const std::string& path, const std::string& host,
                     SshHostConfig& out, std::string& err) {
    std::ifstream in(expandUserPath(path));
    if (!in.is_open()) {
        out = SshHostConfig{};
        out.hostName = host;
        return true;
    }
    return parseSshConfig(in, host, out, err);
}

} // namespace sftpovw
