#include "octpkg/fetcher.hpp"
#include "octpkg/description.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>

namespace octpkg {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Character distance used to suggest a similar package name
long name_distance(const std::string& a, const std::string& b) {
    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer = a.size() <= b.size() ? b : a;
    long d = 0;
    for (size_t i = 0; i < shorter.size(); ++i) {
        d += std::labs(static_cast<long>(shorter[i]) - static_cast<long>(longer[i]));
    }
    for (size_t i = shorter.size(); i < longer.size(); ++i) {
        d += static_cast<unsigned char>(longer[i]);
    }
    return d;
}

Result<std::string> checked_name(const std::string& name) {
    if (!is_valid_package_name(name)) {
        return Result<std::string>::err(Error(ErrorCode::InvalidArgument,
                                              "invalid package name: " + name, {name}));
    }
    return Result<std::string>::ok(to_lower(name));
}

} // namespace

std::optional<std::string> parse_forge_version(const std::string& html) {
    std::string compact;
    compact.reserve(html.size());
    for (char c : html) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
    }

    static const std::regex pattern(
        R"(<tdclass="package_table">PackageVersion:</td><td>([\d.]*)</td>)");
    std::smatch match;
    if (!std::regex_search(compact, match, pattern) || match[1].str().empty()) {
        return std::nullopt;
    }
    return match[1].str();
}

std::vector<std::string> parse_package_list(const std::string& text) {
    std::vector<std::string> names;
    std::istringstream in(text);
    std::string word;
    while (in >> word) names.push_back(word);
    return names;
}

ForgeIndex::ForgeIndex(std::string base_url) : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

Result<std::string> ForgeIndex::latest_version(const std::string& name) {
    using R = Result<std::string>;

    auto checked = checked_name(name);
    if (checked.isErr()) return checked;
    const std::string& pkg = checked.value();

    auto page = download_string(base_url_ + "/" + pkg + "/index.html");
    if (page.isOk()) {
        auto version = parse_forge_version(page.value());
        if (!version) {
            return R::err(Error(ErrorCode::FetchError,
                                "could not read version number from the index page of " + pkg, {pkg}));
        }
        return R::ok(*version);
    }

    spdlog::debug("index page for {} unavailable: {}", pkg, page.error().message());

    auto listing = list_packages();
    if (listing.isErr()) {
        return R::err(Error(ErrorCode::FetchError,
                            "could not reach the package index: " + listing.error().message(), {pkg}));
    }

    const auto& known = listing.value();
    if (std::find(known.begin(), known.end(), pkg) != known.end()) {
        return R::err(Error(ErrorCode::FetchError,
                            "package " + pkg + " exists, but its index page is not available", {pkg}));
    }

    std::string message = "package not found in the index: " + pkg;
    long best = std::numeric_limits<long>::max();
    std::string suggestion;
    for (const auto& candidate : known) {
        long d = name_distance(pkg, candidate);
        if (d < best) {
            best = d;
            suggestion = candidate;
        }
    }
    if (!suggestion.empty()) message += " (did you mean " + suggestion + "?)";
    return R::err(Error(ErrorCode::NotFoundError, message, {pkg}));
}

Result<std::string> ForgeIndex::download_url(const std::string& name, const std::string& version) {
    auto checked = checked_name(name);
    if (checked.isErr()) return checked;
    return Result<std::string>::ok(base_url_ + "/download/" + checked.value() + "-" + version + ".tar.gz");
}

Result<std::vector<std::string>> ForgeIndex::list_packages() {
    using R = Result<std::vector<std::string>>;
    auto text = download_string(base_url_ + "/list_packages.php");
    if (text.isErr()) return R::err(text.error());
    return R::ok(parse_package_list(text.value()));
}

} // namespace octpkg
