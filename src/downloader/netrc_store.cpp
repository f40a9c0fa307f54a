/*
 * ruget/src/downloader/netrc_store.cpp
 *
 * Minimal .netrc reader:
 * - Tokens: machine <host>, default, login <name>, password <secret>, account <x>
 * - macdef bodies are skipped up to the next blank line
 * - First matching machine wins; "default" applies when no machine matches
 * - Entries without both login and password are ignored
 */

#include <ruget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace ruget::downloader {

namespace fs = std::filesystem;

namespace {

struct NetrcEntry {
    std::string host; // empty for "default"
    bool isDefault{false};
    std::string login;
    std::string password;
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

class NetrcStore final : public ICredentialStore {
public:
    explicit NetrcStore(std::vector<NetrcEntry> entries) : entries_(std::move(entries)) {}

    std::optional<Credentials> lookup(std::string_view host) const override {
        const auto wanted = to_lower(host);
        const NetrcEntry* fallback = nullptr;
        for (const auto& e : entries_) {
            if (e.login.empty() || e.password.empty())
                continue;
            if (e.isDefault) {
                if (!fallback)
                    fallback = &e;
                continue;
            }
            if (e.host == wanted)
                return Credentials{e.login, e.password};
        }
        if (fallback)
            return Credentials{fallback->login, fallback->password};
        return std::nullopt;
    }

private:
    std::vector<NetrcEntry> entries_;
};

std::vector<NetrcEntry> parseNetrc(std::string_view contents) {
    std::vector<NetrcEntry> entries;
    std::istringstream in{std::string(contents)};
    std::string line;
    bool inMacdef = false;
    std::string pendingKey;

    while (std::getline(in, line)) {
        if (inMacdef) {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                inMacdef = false;
            continue;
        }

        std::istringstream tokens(line);
        std::string tok;
        while (tokens >> tok) {
            if (!pendingKey.empty()) {
                if (pendingKey == "machine") {
                    entries.push_back(NetrcEntry{to_lower(tok), false, {}, {}});
                } else if (!entries.empty()) {
                    if (pendingKey == "login")
                        entries.back().login = tok;
                    else if (pendingKey == "password")
                        entries.back().password = tok;
                }
                pendingKey.clear();
                continue;
            }

            if (tok == "machine" || tok == "login" || tok == "password" || tok == "account") {
                pendingKey = tok;
            } else if (tok == "default") {
                entries.push_back(NetrcEntry{{}, true, {}, {}});
            } else if (tok == "macdef") {
                inMacdef = true;
                break;
            } else if (!tok.empty() && tok.front() == '#') {
                break;
            }
        }
    }
    return entries;
}

} // namespace

std::unique_ptr<ICredentialStore> makeNetrcStore(std::string_view contents) {
    return std::make_unique<NetrcStore>(parseNetrc(contents));
}

Result<std::unique_ptr<ICredentialStore>> loadNetrcStore(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        spdlog::debug("No netrc file at '{}'", path.string());
        return makeNetrcStore({});
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot read netrc file: " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return makeNetrcStore(buf.str());
}

fs::path defaultNetrcPath() {
    if (const char* env = std::getenv("NETRC"); env && *env)
        return fs::path(env);
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".netrc";
    return {};
}

} // namespace ruget::downloader
