/*
 * ruget/src/downloader/url_utils.cpp
 *
 * String helpers shared by the engine and the CLI: output name derivation, host
 * extraction for credential lookup, header argument parsing and URL list loading.
 */

#include <ruget/downloader/downloader.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <regex>
#include <string>

namespace ruget::downloader {

namespace {

constexpr std::string_view kDefaultFilename = "download.bin";

// Extensions that usually mean the last segment is a host, not a file
constexpr std::array<std::string_view, 64> kDomainSuffixes = {
    "com",  "org", "net", "edu", "gov", "mil",  "int",  "co",   "uk",   "ca",    "au",
    "de",   "fr",  "jp",  "cn",  "ru",  "br",   "in",   "it",   "es",   "nl",    "se",
    "no",   "fi",  "dk",  "pl",  "be",  "ch",   "at",   "cz",   "hu",   "ie",    "pt",
    "gr",   "bg",  "ro",  "hr",  "si",  "sk",   "lt",   "lv",   "ee",   "is",    "mt",
    "cy",   "lu",  "mc",  "li",  "ad",  "sm",   "va",   "tv",   "cc",   "tk",    "ml",
    "ga",   "cf",  "biz", "info", "name", "pro", "aero", "coop", "museum"};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Everything after "scheme://", or the whole string when there is no scheme
std::string_view afterScheme(std::string_view url) {
    auto pos = url.find("://");
    return pos == std::string_view::npos ? url : url.substr(pos + 3);
}

bool isSafeFilename(std::string_view name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos;
}

} // namespace

std::string ByteRange::headerValue() const {
    std::string v = "bytes=" + std::to_string(start) + "-";
    if (end)
        v += std::to_string(*end);
    return v;
}

std::optional<std::string> filenameFromContentDisposition(std::string_view value) {
    static const std::regex re(R"re(filename\s*=\s*(?:"([^"]+)"|([^;\s]+)))re",
                               std::regex::icase);
    std::string s(value);
    std::smatch m;
    if (!std::regex_search(s, m, re))
        return std::nullopt;
    std::string name = m[1].matched ? m[1].str() : m[2].str();
    name = trim(name);
    if (!isSafeFilename(name))
        return std::nullopt;
    return name;
}

std::string fallbackFilename(std::string_view url) {
    auto rest = afterScheme(url);
    rest = rest.substr(0, rest.find_first_of("?#"));

    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
        return std::string(kDefaultFilename); // host only

    auto segment = rest.substr(rest.rfind('/') + 1);
    if (segment.empty())
        return std::string(kDefaultFilename);

    auto dot = segment.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= segment.size())
        return std::string(kDefaultFilename);

    auto ext = segment.substr(dot + 1);
    if (ext.size() > 5)
        return std::string(kDefaultFilename);
    if (!std::all_of(ext.begin(), ext.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; }))
        return std::string(kDefaultFilename);
    if (std::find(kDomainSuffixes.begin(), kDomainSuffixes.end(), to_lower(ext)) !=
        kDomainSuffixes.end())
        return std::string(kDefaultFilename);

    return isSafeFilename(segment) ? std::string(segment) : std::string(kDefaultFilename);
}

std::string hostFromUrl(std::string_view url) {
    auto authority = afterScheme(url);
    authority = authority.substr(0, authority.find_first_of("/?#"));

    auto at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority = authority.substr(at + 1);

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            return {};
        return to_lower(authority.substr(1, close - 1));
    }

    authority = authority.substr(0, authority.find(':'));
    return to_lower(authority);
}

// Helper: Base64 encoding for Basic auth
std::string base64Encode(std::string_view in) {
    static constexpr std::string_view chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    int val = 0;
    int valb = -6;
    for (unsigned char c : in) {
        val = ((val << 8) + c) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            out.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6)
        out.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4)
        out.push_back('=');
    return out;
}

std::vector<Header> parseHeaderArgs(const std::vector<std::string>& args,
                                    std::vector<std::string>* skipped) {
    std::vector<Header> headers;
    headers.reserve(args.size());
    for (const auto& raw : args) {
        auto colon = raw.find(':');
        std::string name = colon == std::string::npos ? std::string{} : trim(raw.substr(0, colon));
        if (name.empty() || name.find_first_of(" \t") != std::string::npos) {
            if (skipped)
                skipped->push_back(raw);
            continue;
        }
        headers.push_back({std::move(name), trim(std::string_view(raw).substr(colon + 1))});
    }
    return headers;
}

bool hasHeader(const std::vector<Header>& headers, std::string_view name) {
    const auto wanted = to_lower(name);
    return std::any_of(headers.begin(), headers.end(),
                       [&](const Header& h) { return to_lower(h.name) == wanted; });
}

Result<std::vector<std::string>> loadUrlList(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot read input file: " + path.string()};
    }
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        auto t = trim(line);
        if (t.empty() || t.front() == '#')
            continue;
        urls.push_back(std::move(t));
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed for input file: " + path.string()};
    }
    return urls;
}

} // namespace ruget::downloader
